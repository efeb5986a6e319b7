#include "common/TargetSet.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace ddns::common {

namespace {

std::string normalize(const std::string& sValue) {
  const auto iBegin = sValue.find_first_not_of(" \t");
  if (iBegin == std::string::npos) {
    return {};
  }
  const auto iEnd = sValue.find_last_not_of(" \t");
  std::string sOut = sValue.substr(iBegin, iEnd - iBegin + 1);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sOut;
}

// Names are placed verbatim in the request path.
bool isValidHostPart(const std::string& sValue) {
  return std::all_of(sValue.begin(), sValue.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '*';
  });
}

}  // namespace

TargetSet::TargetSet(std::vector<Target> vTargets) : _vTargets(std::move(vTargets)) {}

TargetSet TargetSet::parse(const std::string& sDomain, const std::string& sSubdomainList) {
  std::string sBase = normalize(sDomain);
  while (!sBase.empty() && sBase.back() == '.') {
    sBase.pop_back();
  }
  if (sBase.empty()) {
    throw ConfigError("missing_domain", "Base domain must not be empty");
  }
  if (!isValidHostPart(sBase)) {
    throw ConfigError("invalid_domain", "PORKBUN_DOMAIN contains invalid characters: " + sBase);
  }

  // An empty list, or a trailing ',', still yields one (root) entry.
  std::vector<std::string> vEntries;
  std::string::size_type iStart = 0;
  while (true) {
    const auto iComma = sSubdomainList.find(',', iStart);
    if (iComma == std::string::npos) {
      vEntries.push_back(sSubdomainList.substr(iStart));
      break;
    }
    vEntries.push_back(sSubdomainList.substr(iStart, iComma - iStart));
    iStart = iComma + 1;
  }

  std::vector<Target> vTargets;
  std::set<std::string> setSeen;
  for (const auto& sEntry : vEntries) {
    std::string sSub = normalize(sEntry);
    if (sSub == "@") {
      sSub.clear();
    }
    if (!isValidHostPart(sSub)) {
      throw ConfigError("invalid_subdomain",
                        "PORKBUN_SUBDOMAIN entry contains invalid characters: '" + sSub + "'");
    }

    Target tg{sBase, sSub};
    const std::string sFqdn = tg.fqdn();
    if (!setSeen.insert(sFqdn).second) {
      Logger::get()->warn("Duplicate target '{}' in PORKBUN_SUBDOMAIN ignored", sFqdn);
      continue;
    }
    vTargets.push_back(std::move(tg));
  }

  return TargetSet(std::move(vTargets));
}

}  // namespace ddns::common
