#include "boxrun/config.hpp"

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace boxrun {

namespace {

constexpr const char* kUidVariable = "BOXRUN_SANDBOX_UID";
constexpr const char* kGidVariable = "BOXRUN_SANDBOX_GID";
constexpr const char* kLogLevelVariable = "BOXRUN_LOG_LEVEL";
constexpr std::size_t kFallbackPwBufferSize = 16384;

Error config_error(std::string context) {
  return Error{.code = make_error_code(errc::invalid_config), .context = std::move(context)};
}

bool is_numeric(std::string_view text) {
  return !text.empty() && std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; });
}

// Out-of-range values and (Id)-1, which set*id() treats as "unchanged", are rejected.
template <typename Id>
std::optional<Id> parse_numeric_id(std::string_view text) {
  Id value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size() ||
      value == std::numeric_limits<Id>::max()) {
    return std::nullopt;
  }
  return value;
}

std::size_t lookup_buffer_size(int name) {
  long size = ::sysconf(name);
  return size > 0 ? static_cast<std::size_t>(size) : kFallbackPwBufferSize;
}

struct UserEntry {
  uid_t uid;
  gid_t primary_gid;
};

std::optional<UserEntry> lookup_user(const std::string& name_or_id) {
  std::vector<char> buffer(lookup_buffer_size(_SC_GETPW_R_SIZE_MAX));
  passwd entry{};
  passwd* found = nullptr;
  if (is_numeric(name_or_id)) {
    auto uid = parse_numeric_id<uid_t>(name_or_id);
    if (!uid) {
      return std::nullopt;
    }
    if (::getpwuid_r(*uid, &entry, buffer.data(), buffer.size(), &found) == 0 && found) {
      return UserEntry{found->pw_uid, found->pw_gid};
    }
    // Numeric ids without a passwd entry are still usable, only the primary group is unknown.
    return UserEntry{*uid, static_cast<gid_t>(-1)};
  }
  if (::getpwnam_r(name_or_id.c_str(), &entry, buffer.data(), buffer.size(), &found) == 0 &&
      found) {
    return UserEntry{found->pw_uid, found->pw_gid};
  }
  return std::nullopt;
}

std::optional<gid_t> lookup_group(const std::string& name_or_id) {
  if (is_numeric(name_or_id)) {
    return parse_numeric_id<gid_t>(name_or_id);
  }
  std::vector<char> buffer(lookup_buffer_size(_SC_GETGR_R_SIZE_MAX));
  group entry{};
  group* found = nullptr;
  if (::getgrnam_r(name_or_id.c_str(), &entry, buffer.data(), buffer.size(), &found) == 0 &&
      found) {
    return found->gr_gid;
  }
  return std::nullopt;
}

std::optional<std::string> read_variable(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

Environment default_environment() {
  return Environment{
      {"PATH", "/usr/local/bin:/usr/bin:/bin"},
      {"LANG", "C.UTF-8"},
      {"HOME", "/tmp"},
  };
}

std::shared_ptr<spdlog::logger> make_logger(std::string name, spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(std::move(name), std::move(sink));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%t] [%l] %v");
  logger->set_level(level);
  return logger;
}

Result<SandboxConfig> SandboxConfig::from_environment() {
  SandboxConfig config;

  auto level = spdlog::level::info;
  if (auto level_name = read_variable(kLogLevelVariable)) {
    level = spdlog::level::from_str(*level_name);
    // from_str maps unknown names to "off"; only accept an explicit "off".
    if (level == spdlog::level::off && *level_name != "off") {
      return config_error(std::string(kLogLevelVariable) + "=" + *level_name);
    }
  }
  config.logger = make_logger("boxrun", level);

  auto uid_text = read_variable(kUidVariable);
  auto gid_text = read_variable(kGidVariable);
  if (!uid_text && !gid_text) {
    return config;
  }
  if (!uid_text) {
    return config_error(std::string(kGidVariable) + " set without " + kUidVariable);
  }

  auto user = lookup_user(*uid_text);
  if (!user) {
    return config_error(std::string(kUidVariable) + "=" + *uid_text);
  }
  gid_t gid = user->primary_gid;
  if (gid_text) {
    auto parsed = lookup_group(*gid_text);
    if (!parsed) {
      return config_error(std::string(kGidVariable) + "=" + *gid_text);
    }
    gid = *parsed;
  } else if (gid == static_cast<gid_t>(-1)) {
    return config_error(std::string(kUidVariable) + " has no primary group; set " + kGidVariable);
  }

  config.identity = SandboxIdentity{.uid = user->uid, .gid = gid};
  return config;
}

}  // namespace boxrun
