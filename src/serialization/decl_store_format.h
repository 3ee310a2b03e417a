#ifndef DECLCACHE_SERIALIZATION_DECL_STORE_FORMAT_H
#define DECLCACHE_SERIALIZATION_DECL_STORE_FORMAT_H

#include <cstdint>

#include "llvm/Bitstream/BitCodes.h"

namespace serialization {

/// Declaration store file layout. A store is an LLVM bitstream that starts
/// with the four byte signature 'DCST':
///
///   CONTROL_BLOCK
///     METADATA        [major, minor, store-kind]
///     MODULE_NAME     [chars...]
///     ORIGINAL_FILE   [chars...]
///     INPUT_FILE      [size, content-hash, chars...]   (one per file)
///     PP_STATE        [#once, ordinal..., #macros, (length, chars...)...]
///   AST_BLOCK
///     DECLS_BLOCK     one record per declaration, IDs in emission order
///     DECL_OFFSETS    [count, blob]  bit offset of each declaration record
///     LOOKUP_TABLE    [bucket-offset, blob]  qualified name -> IDs
///     TU_DECLS        [ID...]
constexpr char StoreSignature[4] = {'D', 'C', 'S', 'T'};

/// A reader rejects stores with a different major version.
constexpr unsigned VersionMajor = 2;
constexpr unsigned VersionMinor = 0;

enum class StoreKind : uint8_t { PCH = 0, Module = 1 };

/// Declaration ID 0 names the translation unit; stored declarations are
/// numbered from 1.
using DeclID = uint32_t;
constexpr DeclID TranslationUnitID = 0;

enum BlockIDs {
  CONTROL_BLOCK_ID = llvm::bitc::FIRST_APPLICATION_BLOCKID,
  AST_BLOCK_ID,
  DECLS_BLOCK_ID
};

enum ControlRecordTypes {
  METADATA = 1,
  MODULE_NAME = 2,
  ORIGINAL_FILE = 3,
  INPUT_FILE = 4,
  PP_STATE = 5
};

enum ASTRecordTypes {
  DECL_OFFSETS = 1,
  LOOKUP_TABLE = 2,
  TU_DECLS = 3
};

/// Every declaration record starts with
///   [parent-ID, file-index, line, column, access, name-length, chars...]
/// where file-index is 1 + the INPUT_FILE ordinal (0 when unknown). The
/// kind-specific payload follows. Entity records (records, enums, typedefs,
/// variables and functions) start their payload with the ODR hash.
enum DeclRecordTypes {
  DECL_NAMESPACE = 1,
  DECL_CXX_RECORD,      // [odr, tag, is-definition, #bases, (type, access)..., #members, IDs...]
  DECL_ENUM,            // [odr, scoped, underlying-type, #constants, IDs...]
  DECL_ENUM_CONSTANT,   // [value]
  DECL_TYPEDEF,         // [odr, type]
  DECL_TYPE_ALIAS,      // [odr, type]
  DECL_FIELD,           // [type]
  DECL_VAR,             // [odr, type, storage, has-init, has-constant, value]
  DECL_PARM_VAR,        // [type]
  DECL_FUNCTION,        // [odr, return-type, storage, inline, has-body, #params, IDs...]
  DECL_CXX_METHOD       // DECL_FUNCTION payload, then [static, const]
};

/// Types are written inline as [type-class, is-const, payload...]:
///   Builtin          [builtin-kind]
///   Pointer          [pointee...]
///   LValueReference  [pointee...]
///   ConstantArray    [size, element...]
///   Record/Enum/Typedef [decl-ID]
enum class TypeCode : uint8_t {
  Null = 0,
  Builtin,
  Pointer,
  LValueReference,
  ConstantArray,
  Record,
  Enum,
  Typedef
};

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_DECL_STORE_FORMAT_H
