#pragma once

#include "LoreComposer/CharacterProfile.h"
#include "LoreComposer/DropPolicy.h"
#include "LoreComposer/EntryOrdering.h"
#include "LoreComposer/LoreActivation.h"
#include "LoreComposer/OperationResult.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	class TokenEstimator;

	enum class SegmentSource : std::uint8_t
	{
		kProfileField,
		kLoreBefore,
		kLoreAfter,
	};

	[[nodiscard]] constexpr std::string_view SegmentSourceName(SegmentSource a_source) noexcept
	{
		switch (a_source) {
		case SegmentSource::kProfileField:
			return "profile-field";
		case SegmentSource::kLoreBefore:
			return "lore-before";
		case SegmentSource::kLoreAfter:
			return "lore-after";
		}
		return "unknown";
	}

	struct PromptSegment
	{
		// Profile field name, or "lore:<entry name>" / "lore:#<id>".
		std::string fieldName{};
		std::string text{};
		std::uint32_t tokens{ 0 };
		SegmentSource source{ SegmentSource::kProfileField };
		std::int32_t priority{ 0 };
		// Position in the assembled sequence before any budgeting.
		std::uint32_t order{ 0 };
		// Card-definition order for fields; index in the lorebook for lore.
		std::uint32_t definitionOrder{ 0 };
		// Lore segments only.
		EntryOrderKey loreOrder{};
		bool truncated{ false };
		std::uint32_t originalTokens{ 0 };
	};

	struct Composition
	{
		std::string variant{};
		std::vector<PromptSegment> segments{};
		// Removed segments, plus the untruncated original of every truncated one.
		std::vector<PromptSegment> droppedSegments{};
		std::uint32_t totalTokens{ 0 };
		bool overBudget{ false };
		// Non-empty segment texts joined by blank lines.
		std::string fullPrompt{};
	};

	struct ComposeOptions
	{
		// Probe input for activation. Unset: the profile's greeting (first_mes).
		std::optional<std::string> input{};
		std::vector<std::string> history{};
		ActivationOptions activation{};
	};

	struct FieldChangePreview
	{
		Composition original{};
		Composition modified{};
		std::int64_t tokenDelta{ 0 };
		bool activationReused{ false };
	};

	struct VariantComparison
	{
		std::vector<Composition> compositions{};
	};

	// Fields of the variant framed by before_char and after_char lore, token counted, then
	// budgeted when a_budget is set. a_out is only written on success.
	[[nodiscard]] OperationResult ComposePrompt(
		const CharacterProfile& a_profile,
		std::string_view a_variant,
		const std::optional<TokenBudget>& a_budget,
		const ComposeOptions& a_options,
		const TokenEstimator& a_estimator,
		Composition& a_out);

	// Composes a_profile before and after replacing one field. Activation runs once unless the
	// replaced field is the probe input.
	[[nodiscard]] OperationResult PreviewFieldChange(
		const CharacterProfile& a_profile,
		std::string_view a_fieldName,
		std::string a_newValue,
		std::string_view a_variant,
		const std::optional<TokenBudget>& a_budget,
		const ComposeOptions& a_options,
		const TokenEstimator& a_estimator,
		FieldChangePreview& a_out);

	// Same profile and activation under several variants; an empty list means all of them.
	[[nodiscard]] OperationResult CompareVariants(
		const CharacterProfile& a_profile,
		const std::vector<std::string>& a_variants,
		const std::optional<TokenBudget>& a_budget,
		const ComposeOptions& a_options,
		const TokenEstimator& a_estimator,
		VariantComparison& a_out);

	// Longest UTF-8 safe prefix of a_text whose estimate fits a_allowance.
	[[nodiscard]] std::string TruncateToTokenAllowance(
		std::string_view a_text,
		std::uint32_t a_allowance,
		const TokenEstimator& a_estimator);

	// Applies a_budget to an assembled composition in place.
	void ApplyTokenBudget(
		Composition& a_composition,
		const TokenBudget& a_budget,
		const TokenEstimator& a_estimator);

	[[nodiscard]] std::string JoinPromptSegments(const std::vector<PromptSegment>& a_segments);
}
