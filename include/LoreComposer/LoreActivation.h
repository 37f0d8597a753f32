#pragma once

#include "LoreComposer/LoreBook.h"
#include "LoreComposer/RegexKey.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	class TokenEstimator;

	enum class ActivationReason : std::uint8_t
	{
		kKeyMatch,
		kConstant,
		kRecursive,
	};

	[[nodiscard]] constexpr std::string_view ActivationReasonName(ActivationReason a_reason) noexcept
	{
		switch (a_reason) {
		case ActivationReason::kKeyMatch:
			return "key-match";
		case ActivationReason::kConstant:
			return "constant";
		case ActivationReason::kRecursive:
			return "recursive";
		}
		return "unknown";
	}

	struct ActivationOptions
	{
		// Number of trailing history turns scanned. Unset: the book's scan_depth, or the full
		// history when the book has none.
		std::optional<std::uint32_t> scanDepth{};
		std::uint64_t seed{ 0 };
		RegexLimits regex{};
	};

	// Entry pointers refer into the LoreBook passed to ActivateEntries; the book must outlive
	// the result.
	struct ActivationResult
	{
		const LoreEntry* entry{ nullptr };
		// Position of the entry in LoreBook::entries.
		std::uint32_t entryIndex{ 0 };
		std::vector<std::string> matchedKeys{};
		std::vector<std::string> matchedSecondaryKeys{};
		ActivationReason reason{ ActivationReason::kKeyMatch };
		std::uint32_t pass{ 1 };
	};

	struct ActivationOutcome
	{
		// Sorted by priority desc, insertion_order asc, id asc.
		std::vector<ActivationResult> activations{};
		std::vector<const LoreEntry*> beforeGroup{};
		std::vector<const LoreEntry*> afterGroup{};
		std::uint32_t passes{ 0 };
	};

	struct TriggerTestResult
	{
		ActivationOutcome outcome{};
		std::string injectionPreview{};
		std::uint32_t totalTokens{ 0 };
	};

	struct EntryStats
	{
		std::uint32_t total{ 0 };
		std::uint32_t enabled{ 0 };
		std::uint32_t disabled{ 0 };
		std::uint32_t constant{ 0 };
		std::uint32_t beforeChar{ 0 };
		std::uint32_t afterChar{ 0 };
		std::uint32_t selective{ 0 };
		std::uint32_t regex{ 0 };
		double averagePriority{ 0.0 };
	};

	[[nodiscard]] std::optional<std::uint32_t> ResolveScanDepth(
		const LoreBook& a_book,
		const ActivationOptions& a_options) noexcept;

	// Last a_scanDepth turns (all when unset) followed by a_input, newline separated.
	[[nodiscard]] std::string BuildScanWindow(
		std::string_view a_input,
		const std::vector<std::string>& a_history,
		std::optional<std::uint32_t> a_scanDepth);

	[[nodiscard]] ActivationOutcome ActivateEntries(
		const LoreBook& a_book,
		std::string_view a_input,
		const std::vector<std::string>& a_history,
		const ActivationOptions& a_options);

	// Activation plus the injected text preview. A null book yields an empty result.
	[[nodiscard]] TriggerTestResult TestInput(
		std::string_view a_input,
		const LoreBook* a_book,
		const std::vector<std::string>& a_history,
		const ActivationOptions& a_options,
		const TokenEstimator& a_estimator);

	[[nodiscard]] EntryStats GetEntryStats(const LoreBook* a_book) noexcept;
}
