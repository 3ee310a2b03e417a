#ifndef DECLCACHE_SERIALIZATION_ODR_HASH_H
#define DECLCACHE_SERIALIZATION_ODR_HASH_H

#include <cstdint>
#include <string>

class NamedDecl;

namespace serialization {

/// Structural description of an entity used to decide whether two stores
/// carry the same definition. Source locations and declaration IDs do not
/// take part.
std::string getODRString(const NamedDecl *D);

/// xxHash64 of getODRString(D).
uint64_t computeODRHash(const NamedDecl *D);

/// The stored hash when D came from a store, otherwise a freshly computed one.
uint64_t getOrComputeODRHash(const NamedDecl *D);

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_ODR_HASH_H
