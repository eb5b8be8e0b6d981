#pragma once

#include <string>
#include <unordered_set>

namespace ferry::remote {

// Result codes returned by the remote storage service.
inline constexpr int kSuccess = 0;
inline constexpr int kGenericFailure = -1;
inline constexpr int kNotLoggedIn = -4;
inline constexpr int kDuplicateName = -8;
inline constexpr int kLinkExpired = -9;
inline constexpr int kInsufficientCapacity = -10;
inline constexpr int kAccessCodeRejected = -12;
inline constexpr int kTooManyAccesses = -62;
inline constexpr int kBadParameter = 2;

// Local code for a call abandoned after its deadline. Never sent by the service.
inline constexpr int kCallTimedOut = -1000;

// Human-readable text for a result code, "unknown error" when not in the table.
std::string describe(int code);

// Codes that end a task as skipped. Shared by the transfer and share flows.
[[nodiscard]] bool isSkippable(int code);

const std::unordered_set<int>& skipSet();

} // namespace ferry::remote
