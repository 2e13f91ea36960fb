#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace treehop::consts {

// Directory and file names
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kWorktreesDir  = "worktrees";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kPackedRefs    = "packed-refs";
inline constexpr std::string_view kCommonDirFile = "commondir";
inline constexpr std::string_view kGitDirFile    = "gitdir";
inline constexpr std::string_view kLockedFile    = "locked";

// Ref namespaces
inline constexpr std::string_view kHeadsPrefix   = "refs/heads/";
inline constexpr std::string_view kRemotesPrefix = "refs/remotes/";

// Identifier that always names the project's main checkout
inline constexpr std::string_view kMainIdentifier = "main";

// ——— Marker written into a linked worktree's .git file ———
inline constexpr std::string_view kGitDirMarker = "gitdir:";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Header prefixes (used in parsing) ———
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kTypeCommit      = "commit";

// ——— Context detection ———
inline constexpr std::chrono::milliseconds kDefaultCacheTtl{5000};
// Longer TTLs are capped so expiry stays representable on the steady clock.
inline constexpr std::chrono::milliseconds kMaxCacheTtl = std::chrono::hours(24 * 365);
inline constexpr std::string_view kDefaultCacheTtlText = "5s";

// ——— Environment ———
inline constexpr std::string_view kEnvPrefix = "TREEHOP_";
inline constexpr std::string_view kAppName   = "treehop";

} // namespace treehop::consts
