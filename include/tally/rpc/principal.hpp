#pragma once

#include <grpcpp/security/auth_context.h>
#include <tally/schema/transfer_args.hpp>
#include <optional>

namespace tally::rpc {

/// Caller principal of an authenticated connection.
///
/// Write calls are only accepted over mutual TLS. The verified client
/// certificate carries the owner principal as hex in its common name; an
/// unauthenticated peer, a missing or repeated common name, or one that is not
/// a 1..29 byte hex owner yields std::nullopt.
std::optional<tally::schema::principal_t> authenticated_principal(
    const grpc::AuthContext& auth);

}  // namespace tally::rpc
