#pragma once

#include "LoreComposer/DropPolicy.h"
#include "LoreComposer/JsonFile.h"
#include "LoreComposer/LoreActivation.h"
#include "LoreComposer/TokenEstimator.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace LoreComposer
{
	inline constexpr std::size_t kMinRegexPatternLength = 16;
	inline constexpr std::size_t kMaxRegexPatternLength = 4096;
	inline constexpr std::size_t kMinRegexWindowBytes = 1024;
	inline constexpr std::size_t kMaxRegexWindowBytes = 16u * 1024u;
	inline constexpr std::uint32_t kMaxScanDepth = 10000;

	struct LoggingSettings
	{
		bool debugLog{ false };
		// Empty: log to stderr.
		std::string file{};
	};

	struct EngineSettings
	{
		LoggingSettings logging{};
		std::string tokenizer{ kDefaultTokenizerId };
		ActivationOptions activation{};
		// maxTokens == 0 disables budgeting.
		TokenBudget budget{ .preserveFields = MakeDefaultPreserveFields() };

		[[nodiscard]] std::optional<TokenBudget> ResolveBudget() const
		{
			if (budget.maxTokens == 0) {
				return std::nullopt;
			}
			return budget;
		}
	};

	// Malformed sections are logged and left at their defaults; numbers are clamped into range.
	[[nodiscard]] EngineSettings ParseEngineSettings(const nlohmann::json& a_root);

	// a_out is reset to defaults first, so it is usable whatever the status.
	[[nodiscard]] LoadJsonStatus LoadEngineSettings(const std::filesystem::path& a_path, EngineSettings& a_out);
}
