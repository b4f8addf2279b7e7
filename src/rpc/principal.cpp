#include <grpc/grpc_security_constants.h>
#include <spdlog/spdlog.h>
#include <string>
#include <tally/rpc/principal.hpp>
#include <tally/schema/account.hpp>

using namespace tally::schema;

namespace tally::rpc {

std::optional<principal_t> authenticated_principal(
    const grpc::AuthContext& auth) {
  if (!auth.IsPeerAuthenticated()) {
    return std::nullopt;
  }
  auto names = auth.FindPropertyValues(GRPC_X509_CN_PROPERTY_NAME);
  if (names.size() != 1) {
    spdlog::debug("Peer certificate carries {} common name(s)", names.size());
    return std::nullopt;
  }
  auto owner = try_from_hex(std::string{names.front().data(),
                                        names.front().size()});
  if (!owner || owner->empty() || owner->size() > kMaxOwnerSize) {
    spdlog::debug("Peer common name is not a hex owner principal");
    return std::nullopt;
  }
  return owner;
}

}  // namespace tally::rpc
