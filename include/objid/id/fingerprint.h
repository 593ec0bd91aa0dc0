#pragma once

#include "objid/core/result.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace objid::id {

// Source of machine identity: one description per network interface entry
// visible to the process, in enumeration order.
class INetworkInterfaceSource {
 public:
  virtual ~INetworkInterfaceSource() = default;

  virtual core::Result<std::vector<std::string>, std::string> list_interfaces() = 0;

 protected:
  INetworkInterfaceSource() = default;
  INetworkInterfaceSource(const INetworkInterfaceSource&) = default;
  INetworkInterfaceSource& operator=(const INetworkInterfaceSource&) = default;
  INetworkInterfaceSource(INetworkInterfaceSource&&) = default;
  INetworkInterfaceSource& operator=(INetworkInterfaceSource&&) = default;
};

// Source of process identity.
// process_id() is the OS process id; isolation_unit_id() distinguishes
// independent copies of this library loaded into the same process.
class IProcessIdentitySource {
 public:
  virtual ~IProcessIdentitySource() = default;

  virtual core::Result<std::uint32_t, std::string> process_id() = 0;
  virtual std::uint32_t isolation_unit_id() = 0;

 protected:
  IProcessIdentitySource() = default;
  IProcessIdentitySource(const IProcessIdentitySource&) = default;
  IProcessIdentitySource& operator=(const IProcessIdentitySource&) = default;
  IProcessIdentitySource(IProcessIdentitySource&&) = default;
  IProcessIdentitySource& operator=(IProcessIdentitySource&&) = default;
};

// Source of substitute values when an identity source is unavailable.
// Not required to be cryptographically strong.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  virtual std::uint32_t next_u32() = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Enumerates interfaces with getifaddrs(3).
class SystemNetworkInterfaceSource final : public INetworkInterfaceSource {
 public:
  core::Result<std::vector<std::string>, std::string> list_interfaces() override;
};

// getpid(2) plus the address of a static object owned by this library image.
class SystemProcessIdentitySource final : public IProcessIdentitySource {
 public:
  core::Result<std::uint32_t, std::string> process_id() override;
  std::uint32_t isolation_unit_id() override;
};

// std::random_device seeded Mersenne Twister; seeded on first use.
class SystemRandomSource final : public IRandomSource {
 public:
  std::uint32_t next_u32() override;
};

// FingerprintSources bundles the inputs of derive_fingerprint.
// Holds references only; the caller owns the sources.
struct FingerprintSources {
  INetworkInterfaceSource& interfaces;  // NOLINT(readability-identifier-naming)
  IProcessIdentitySource& process;      // NOLINT(readability-identifier-naming)
  IRandomSource& random;                // NOLINT(readability-identifier-naming)
};

// Fingerprint is the outcome of one derivation, with the pieces kept for diagnostics.
struct Fingerprint {
  std::uint32_t value{0};          // NOLINT(readability-identifier-naming)
  std::uint32_t machine_piece{0};  // NOLINT(readability-identifier-naming)
  std::uint32_t process_piece{0};  // NOLINT(readability-identifier-naming)
  bool machine_fallback{false};    // NOLINT(readability-identifier-naming)
  bool process_fallback{false};    // NOLINT(readability-identifier-naming)
};

// derive_fingerprint computes machine_piece | process_piece.
//
// machine_piece = hash(concatenated interface descriptions) << 16
// process_piece = hash(hex(process_id) + hex(isolation_unit_id)) & 0xFFFF
//
// An interface source that fails, throws, or reports no interfaces is replaced
// by a random value (shifted the same way); an unavailable process id is
// replaced by a random value before hashing. Both substitutions log a warning
// and set the matching *_fallback flag.
//
// Returns an error message for any other fault (e.g. the random source itself
// failing). Such a fault must not be papered over.
[[nodiscard]] core::Result<Fingerprint, std::string> derive_fingerprint(
    const FingerprintSources& sources);

// Raised when the process fingerprint cannot be computed. Identifiers must not
// be generated without one; the next initialization attempt starts over.
class FingerprintInitializationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace objid::id
