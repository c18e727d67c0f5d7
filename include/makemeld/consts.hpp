#pragma once
#include <cstddef>
#include <string_view>

namespace makemeld::consts {

// Makefile syntax
inline constexpr char kCommentMarker = '#';
inline constexpr char kRecipePrefix  = '\t';
inline constexpr char kContinuation  = '\\';
inline constexpr std::string_view kHelpMarker   = "##";
inline constexpr std::string_view kPhonyTarget  = ".PHONY";
inline constexpr std::string_view kDefaultGoal  = ".DEFAULT_GOAL";
inline constexpr std::string_view kHelpTarget   = "help";
inline constexpr std::string_view kDefine       = "define";
inline constexpr std::string_view kEndef        = "endef";
inline constexpr std::string_view kExport       = "export";
inline constexpr std::string_view kOverride     = "override";

// Header rows of a printf-style help table, not real entries
inline constexpr std::string_view kHelpHeaderName = "Target";
inline constexpr std::string_view kHelpRuleName   = "------";

// ——— Unified diff ———
inline constexpr int kDefaultContext = 3;
inline constexpr std::string_view kNoNewline = "\\ No newline at end of file";

// ——— Settings ———
inline constexpr std::string_view kSettingsFile = ".makemeld";
inline constexpr std::string_view kSettingsEnv  = "MAKEMELD_CONFIG";

// ——— Digest sizes ———
inline constexpr std::size_t kDigestRawLen   = 20; // SHA-1
inline constexpr std::size_t kDigestHexLen   = 40;
inline constexpr std::size_t kDigestShortLen = 12;

} // namespace makemeld::consts
