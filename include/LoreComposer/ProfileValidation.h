#pragma once

#include "LoreComposer/CharacterProfile.h"
#include "LoreComposer/RegexKey.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	enum class IssueSeverity : std::uint8_t
	{
		kError,
		kWarning,
		kInfo,
	};

	[[nodiscard]] constexpr std::string_view IssueSeverityName(IssueSeverity a_severity) noexcept
	{
		switch (a_severity) {
		case IssueSeverity::kError:
			return "error";
		case IssueSeverity::kWarning:
			return "warning";
		case IssueSeverity::kInfo:
			return "info";
		}
		return "unknown";
	}

	struct ValidationIssue
	{
		// "name", "character_book.entries[2].keys", ...
		std::string field{};
		std::string message{};
		IssueSeverity severity{ IssueSeverity::kError };
	};

	struct ValidationReport
	{
		std::vector<ValidationIssue> issues{};
		bool valid{ true };
	};

	// Lints a parsed profile. Never fails; problems come back as issues and valid is false
	// only when at least one of them is an error.
	[[nodiscard]] ValidationReport ValidateProfile(const CharacterProfile& a_profile, const RegexLimits& a_limits);
}
