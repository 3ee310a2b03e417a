#ifndef DECLCACHE_SERIALIZATION_LOOKUP_TABLE_H
#define DECLCACHE_SERIALIZATION_LOOKUP_TABLE_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "serialization/decl_store_format.h"

class DeclContext;

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/DJB.h"
#include "llvm/Support/Endian.h"
#include "llvm/Support/EndianStream.h"
#include "llvm/Support/OnDiskHashTable.h"
#include "llvm/Support/raw_ostream.h"

namespace serialization {

/// Trait for writing the qualified-name lookup table with
/// llvm::OnDiskChainedHashTableGenerator. Each entry maps a qualified name
/// to the IDs of the declarations visible under it.
class LookupTableWriterTrait {
public:
  // Keys and ID lists are owned by the caller for the generator's lifetime.
  using key_type = llvm::StringRef;
  using key_type_ref = llvm::StringRef;
  using data_type = llvm::ArrayRef<DeclID>;
  using data_type_ref = llvm::ArrayRef<DeclID>;
  using hash_value_type = uint32_t;
  using offset_type = uint32_t;

  static hash_value_type ComputeHash(key_type_ref Key) {
    return llvm::djbHash(Key);
  }

  static std::pair<offset_type, offset_type>
  EmitKeyDataLength(llvm::raw_ostream &Out, key_type_ref Key,
                    data_type_ref Data) {
    llvm::support::endian::Writer LE(Out, llvm::support::little);
    offset_type KeyLen = static_cast<offset_type>(Key.size());
    offset_type DataLen = static_cast<offset_type>(Data.size() * 4);
    LE.write<uint32_t>(KeyLen);
    LE.write<uint32_t>(DataLen);
    return std::make_pair(KeyLen, DataLen);
  }

  static void EmitKey(llvm::raw_ostream &Out, key_type_ref Key, offset_type) {
    Out << Key;
  }

  static void EmitData(llvm::raw_ostream &Out, key_type_ref, data_type_ref Data,
                       offset_type) {
    llvm::support::endian::Writer LE(Out, llvm::support::little);
    for (DeclID ID : Data)
      LE.write<uint32_t>(ID);
  }
};

/// Trait for reading the table back through llvm::OnDiskChainedHashTable.
class LookupTableReaderTrait {
public:
  using external_key_type = llvm::StringRef;
  using internal_key_type = llvm::StringRef;
  using data_type = std::vector<DeclID>;
  using hash_value_type = uint32_t;
  using offset_type = uint32_t;

  static bool EqualKey(const internal_key_type &A, const internal_key_type &B) {
    return A == B;
  }

  static hash_value_type ComputeHash(const internal_key_type &Key) {
    return llvm::djbHash(Key);
  }

  static const internal_key_type &GetInternalKey(const external_key_type &Key) {
    return Key;
  }

  static std::pair<offset_type, offset_type>
  ReadKeyDataLength(const unsigned char *&Data) {
    using namespace llvm::support;
    offset_type KeyLen = endian::readNext<uint32_t, little, unaligned>(Data);
    offset_type DataLen = endian::readNext<uint32_t, little, unaligned>(Data);
    return std::make_pair(KeyLen, DataLen);
  }

  static internal_key_type ReadKey(const unsigned char *Data, offset_type KeyLen) {
    return llvm::StringRef(reinterpret_cast<const char *>(Data), KeyLen);
  }

  static data_type ReadData(const internal_key_type &, const unsigned char *Data,
                            offset_type DataLen) {
    using namespace llvm::support;
    data_type Result;
    for (offset_type I = 0; I < DataLen / 4; ++I)
      Result.push_back(endian::readNext<uint32_t, little, unaligned>(Data));
    return Result;
  }
};

/// Key under which Name, declared in DC, is stored: "Name" at translation
/// unit scope, otherwise the qualified name of DC followed by "::Name".
std::string getLookupKey(const DeclContext *DC, llvm::StringRef Name);

using OnDiskLookupTable = llvm::OnDiskChainedHashTable<LookupTableReaderTrait>;

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_LOOKUP_TABLE_H
