#pragma once

#include "LoreComposer/FieldExtractor.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	enum class DropPolicy : std::uint8_t
	{
		kTruncateEnd,
		kOldestFirst,
		kLowestPriority,
	};

	namespace DropPolicies
	{
		inline constexpr std::string_view kTruncateEndName = "truncate-end";
		inline constexpr std::string_view kOldestFirstName = "oldest-first";
		inline constexpr std::string_view kLowestPriorityName = "lowest-priority";
	}

	inline constexpr DropPolicy kDefaultDropPolicy = DropPolicy::kLowestPriority;

	// Implicit lowest-priority rank of a profile field, compared directly against lore
	// priorities; the earlier a field sits in the variant's section list, the higher it ranks.
	inline constexpr std::int32_t kImplicitFieldPriorityBase = 1000;
	inline constexpr std::int32_t kImplicitFieldPriorityStep = 10;

	[[nodiscard]] constexpr std::optional<DropPolicy> ParseDropPolicy(std::string_view a_name) noexcept
	{
		if (a_name == DropPolicies::kTruncateEndName) {
			return DropPolicy::kTruncateEnd;
		}
		if (a_name == DropPolicies::kOldestFirstName) {
			return DropPolicy::kOldestFirst;
		}
		if (a_name == DropPolicies::kLowestPriorityName) {
			return DropPolicy::kLowestPriority;
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::string_view DropPolicyName(DropPolicy a_policy) noexcept
	{
		switch (a_policy) {
		case DropPolicy::kTruncateEnd:
			return DropPolicies::kTruncateEndName;
		case DropPolicy::kOldestFirst:
			return DropPolicies::kOldestFirstName;
		case DropPolicy::kLowestPriority:
			return DropPolicies::kLowestPriorityName;
		}
		return "unknown";
	}

	[[nodiscard]] constexpr std::int32_t ResolveImplicitFieldPriority(std::size_t a_sectionIndex) noexcept
	{
		return kImplicitFieldPriorityBase - static_cast<std::int32_t>(a_sectionIndex) * kImplicitFieldPriorityStep;
	}

	[[nodiscard]] inline std::vector<std::string> MakeDefaultPreserveFields()
	{
		return { std::string(Fields::kDescription), std::string(Fields::kFirstMes) };
	}

	struct TokenBudget
	{
		std::uint32_t maxTokens{ 0 };
		DropPolicy dropPolicy{ kDefaultDropPolicy };
		// Unset: description and first_mes. An empty list preserves nothing.
		std::optional<std::vector<std::string>> preserveFields{};
	};

	[[nodiscard]] inline std::vector<std::string> ResolvePreserveFields(const TokenBudget& a_budget)
	{
		return a_budget.preserveFields.has_value() ? *a_budget.preserveFields : MakeDefaultPreserveFields();
	}
}
