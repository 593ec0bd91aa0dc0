#include "objid/id/fingerprint.h"

#include "objid/core/hashing.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>

#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#ifdef __linux__
#include <netpacket/packet.h>
#endif

namespace objid::id {

namespace {

// Anchor whose address identifies this copy of the library inside the process.
const char kIsolationAnchor = 0;

void append_hex_bytes(std::ostringstream& oss, const unsigned char* data, const std::size_t len) {
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::setw(2) << static_cast<unsigned>(data[i]);
  }
  oss << std::dec;
}

std::string describe_interface(const ifaddrs& entry) {
  std::ostringstream oss;
  oss << "name:" << (entry.ifa_name != nullptr ? entry.ifa_name : "") << " flags:" << std::hex
      << entry.ifa_flags << std::dec;

  const sockaddr* addr = entry.ifa_addr;
  if (addr == nullptr) {
    return oss.str();
  }

  oss << " family:" << addr->sa_family << " addr:";
  switch (addr->sa_family) {
    case AF_INET: {
      const auto* in4 = reinterpret_cast<const sockaddr_in*>(addr);
      append_hex_bytes(oss, reinterpret_cast<const unsigned char*>(&in4->sin_addr),
                       sizeof(in4->sin_addr));
      break;
    }
    case AF_INET6: {
      const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
      append_hex_bytes(oss, reinterpret_cast<const unsigned char*>(&in6->sin6_addr),
                       sizeof(in6->sin6_addr));
      break;
    }
#ifdef __linux__
    case AF_PACKET: {
      const auto* ll = reinterpret_cast<const sockaddr_ll*>(addr);
      append_hex_bytes(oss, ll->sll_addr, ll->sll_halen);
      break;
    }
#endif
    default:
      break;
  }
  return oss.str();
}

// Returns the concatenated interface descriptions, or nullopt when the source
// gives no usable signal.
std::optional<std::string> collect_interfaces(INetworkInterfaceSource& source) {
  try {
    auto listed = source.list_interfaces();
    if (!listed.has_value()) {
      spdlog::warn("Network interface enumeration failed: {}", listed.error());
      return std::nullopt;
    }
    if (listed.value().empty()) {
      spdlog::warn("Network interface enumeration returned no interfaces");
      return std::nullopt;
    }

    std::string joined;
    for (const auto& description : listed.value()) {
      joined += description;
    }
    return joined;
  } catch (const std::exception& e) {
    spdlog::warn("Network interface enumeration threw: {}", e.what());
    return std::nullopt;
  }
}

std::optional<std::uint32_t> read_process_id(IProcessIdentitySource& source) {
  try {
    auto pid = source.process_id();
    if (!pid.has_value()) {
      spdlog::warn("Process id unavailable: {}", pid.error());
      return std::nullopt;
    }
    return pid.value();
  } catch (const std::exception& e) {
    spdlog::warn("Process id lookup threw: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace

core::Result<std::vector<std::string>, std::string>
SystemNetworkInterfaceSource::list_interfaces() {
  ifaddrs* head = nullptr;
  if (getifaddrs(&head) != 0) {
    return core::Result<std::vector<std::string>, std::string>::err(
        std::string("getifaddrs: ") + std::strerror(errno));
  }

  std::vector<std::string> descriptions;
  for (const ifaddrs* entry = head; entry != nullptr; entry = entry->ifa_next) {
    descriptions.push_back(describe_interface(*entry));
  }
  freeifaddrs(head);

  return core::Result<std::vector<std::string>, std::string>::ok(std::move(descriptions));
}

core::Result<std::uint32_t, std::string> SystemProcessIdentitySource::process_id() {
  const pid_t pid = getpid();
  if (pid <= 0) {
    return core::Result<std::uint32_t, std::string>::err("getpid returned " +
                                                         std::to_string(pid));
  }
  return core::Result<std::uint32_t, std::string>::ok(static_cast<std::uint32_t>(pid));
}

std::uint32_t SystemProcessIdentitySource::isolation_unit_id() {
  const auto address = reinterpret_cast<std::uintptr_t>(&kIsolationAnchor);
  const auto wide = static_cast<std::uint64_t>(address);
  return static_cast<std::uint32_t>(wide ^ (wide >> 32));
}

std::uint32_t SystemRandomSource::next_u32() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  return static_cast<std::uint32_t>(gen());
}

core::Result<Fingerprint, std::string> derive_fingerprint(const FingerprintSources& sources) {
  try {
    Fingerprint fp;

    // Machine piece: upper 16 bits from the network interfaces.
    if (const auto joined = collect_interfaces(sources.interfaces); joined.has_value()) {
      fp.machine_piece = core::stable_hash32(*joined) << 16;
    } else {
      fp.machine_piece = sources.random.next_u32() << 16;
      fp.machine_fallback = true;
    }
    spdlog::debug("machine piece: {:x}", fp.machine_piece);

    // Process piece: lower 16 bits from process id and isolation unit.
    std::uint32_t process_id = 0;
    if (const auto pid = read_process_id(sources.process); pid.has_value()) {
      process_id = *pid;
    } else {
      process_id = sources.random.next_u32();
      fp.process_fallback = true;
    }
    const std::uint32_t isolation_id = sources.process.isolation_unit_id();
    fp.process_piece =
        core::stable_hash32(core::hex_u32(process_id) + core::hex_u32(isolation_id)) & 0xFFFFu;
    spdlog::debug("process piece: {:x}", fp.process_piece);

    fp.value = fp.machine_piece | fp.process_piece;
    spdlog::debug("fingerprint: {:x}", fp.value);

    return core::Result<Fingerprint, std::string>::ok(fp);
  } catch (const std::exception& e) {
    return core::Result<Fingerprint, std::string>::err(e.what());
  }
}

}  // namespace objid::id
