#ifndef DECLCACHE_ANALYSIS_RECORD_LAYOUT_H
#define DECLCACHE_ANALYSIS_RECORD_LAYOUT_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "analysis/completeness.h"
#include "ast/type.h"

class RecordDecl;

namespace analysis {

struct TypeSizeInfo {
  uint64_t Size = 0;
  uint64_t Align = 1;
};

/// ASTRecordLayout - Size, alignment and member offsets of a complete
/// record, in bytes, for an LP64 target.
class ASTRecordLayout {
  uint64_t Size;
  uint64_t Alignment;
  // Size without tail padding; an empty record has none.
  uint64_t DataSize;
  std::vector<uint64_t> BaseOffsets;
  std::vector<uint64_t> FieldOffsets;

  friend class RecordLayoutContext;

public:
  ASTRecordLayout(uint64_t Size, uint64_t Alignment, uint64_t DataSize)
      : Size(Size), Alignment(Alignment), DataSize(DataSize) {}

  uint64_t getSize() const { return Size; }
  uint64_t getAlignment() const { return Alignment; }
  uint64_t getDataSize() const { return DataSize; }
  bool isEmpty() const { return DataSize == 0; }

  uint64_t getBaseOffset(unsigned I) const { return BaseOffsets[I]; }
  uint64_t getFieldOffset(unsigned I) const { return FieldOffsets[I]; }
  unsigned getFieldCount() const {
    return static_cast<unsigned>(FieldOffsets.size());
  }
};

/// RecordLayoutContext - Computes and caches record layouts. Laying out a
/// record completes the records it contains by value, since their sizes are
/// part of its own.
class RecordLayoutContext {
public:
  explicit RecordLayoutContext(CompletenessTrigger &Trigger) : Trigger(Trigger) {}

  /// Null when RD (or something it contains by value) stays incomplete.
  const ASTRecordLayout *getRecordLayout(const RecordDecl *RD);
  std::optional<TypeSizeInfo> getTypeInfo(QualType T);

private:
  CompletenessTrigger &Trigger;
  std::map<const RecordDecl *, std::unique_ptr<ASTRecordLayout>> Layouts;
};

} // namespace analysis

#endif // DECLCACHE_ANALYSIS_RECORD_LAYOUT_H
