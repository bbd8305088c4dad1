#include "network/router.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>

namespace lfs {
namespace network {

namespace {

constexpr std::string_view METADATA_PREFIX = "/objects";
constexpr std::string_view RAW_OBJECT_PREFIX = "/data/objects";
constexpr std::string_view SCHEME_SEPARATOR = "://";

// Offset of the authority in an absolute-form target, npos for origin-form
std::size_t authority_offset(std::string_view target) {
  if (target.empty() || target.front() == '/') {
    return std::string_view::npos;
  }
  std::size_t pos = target.find(SCHEME_SEPARATOR);
  if (pos == std::string_view::npos || pos == 0) {
    return std::string_view::npos;
  }
  // Scheme must not contain a path, query or fragment delimiter
  if (target.substr(0, pos).find_first_of("/?#") != std::string_view::npos) {
    return std::string_view::npos;
  }
  return pos + SCHEME_SEPARATOR.size();
}

// Drops "user@" and ":port" from an authority; IPv6 literals keep their brackets
std::string_view authority_host(std::string_view authority) {
  std::size_t at = authority.rfind('@');
  if (at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  if (!authority.empty() && authority.front() == '[') {
    std::size_t close = authority.find(']');
    return close == std::string_view::npos ? std::string_view() : authority.substr(0, close + 1);
  }

  std::size_t colon = authority.find(':');
  return colon == std::string_view::npos ? authority : authority.substr(0, colon);
}

bool is_host_char(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) {
    return true;
  }
  // unreserved, pct-encoded and sub-delims of a reg-name
  return std::string_view("-._~%!$&'()*+,;=").find(c) != std::string_view::npos;
}

// reg-name, IPv4 address or bracketed IP literal; anything else is not a host
bool is_valid_host(std::string_view host) {
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    std::string_view literal = host.substr(1, host.size() - 2);
    return !literal.empty() && std::all_of(literal.begin(), literal.end(), [](char c) {
      return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
    });
  }
  return std::all_of(host.begin(), host.end(), is_host_char);
}

std::optional<std::string> checked_host(std::string_view host) {
  if (host.empty()) {
    return std::nullopt;
  }
  if (!is_valid_host(host)) {
    BOOST_LOG_TRIVIAL(debug) << "Router: Rejected host with invalid characters";
    return std::nullopt;
  }
  return std::string(host);
}

} // namespace

std::ostream& operator<<(std::ostream& os, Intent intent) {
  switch (intent) {
    case Intent::Metadata:  return os << "Metadata";
    case Intent::RawObject: return os << "RawObject";
  }
  return os << "Unknown";
}

namespace router {

//==============================================
// PATH CLASSIFICATION
//==============================================

std::optional<Route> route(std::string_view path) {
  std::size_t slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view prefix = path.substr(0, slash);
  std::string_view candidate = path.substr(slash + 1);

  Intent intent;
  if (prefix == METADATA_PREFIX) {
    intent = Intent::Metadata;
  } else if (prefix == RAW_OBJECT_PREFIX) {
    intent = Intent::RawObject;
  } else {
    return std::nullopt;
  }

  std::optional<store::ObjectId> oid = store::ObjectId::parse(candidate);
  if (!oid) {
    BOOST_LOG_TRIVIAL(debug) << "Router: Rejected malformed object id under " << prefix;
    return std::nullopt;
  }
  return Route{*oid, intent};
}


//==============================================
// REQUEST TARGET PARSING
//==============================================

std::optional<std::string> extract_host(std::string_view target, std::string_view host_header) {
  std::size_t offset = authority_offset(target);
  if (offset != std::string_view::npos) {
    std::string_view authority = target.substr(offset);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    return checked_host(authority_host(authority));
  }
  return checked_host(authority_host(host_header));
}

std::string extract_path(std::string_view target) {
  std::size_t offset = authority_offset(target);
  if (offset != std::string_view::npos) {
    std::size_t path_start = target.find_first_of("/?#", offset);
    if (path_start == std::string_view::npos || target[path_start] != '/') {
      return std::string();
    }
    target.remove_prefix(path_start);
  }
  return std::string(target.substr(0, target.find_first_of("?#")));
}

} // namespace router
} // namespace network
} // namespace lfs
