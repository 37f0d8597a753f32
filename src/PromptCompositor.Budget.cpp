#include "LoreComposer/PromptCompositor.h"

#include "LoreComposer/TextUtil.h"
#include "LoreComposer/TokenEstimator.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace LoreComposer
{
	namespace
	{
		struct BudgetPass
		{
			std::vector<PromptSegment> segments{};
			std::vector<bool> dropped{};
			std::uint32_t total{ 0 };
		};

		[[nodiscard]] bool IsLoreSegment(const PromptSegment& a_segment) noexcept
		{
			return a_segment.source != SegmentSource::kProfileField;
		}

		// Profile fields in card-definition order, then lore from the lowest priority up.
		[[nodiscard]] bool PrecedesOldestFirst(const PromptSegment& a_lhs, const PromptSegment& a_rhs) noexcept
		{
			const bool lhsLore = IsLoreSegment(a_lhs);
			const bool rhsLore = IsLoreSegment(a_rhs);
			if (lhsLore != rhsLore) {
				return !lhsLore;
			}
			if (!lhsLore) {
				return a_lhs.definitionOrder < a_rhs.definitionOrder;
			}
			return PrecedesInEvictionOrder(a_lhs.loreOrder, a_rhs.loreOrder);
		}

		// Lowest priority first, later assembled first on ties.
		[[nodiscard]] bool PrecedesLowestPriority(const PromptSegment& a_lhs, const PromptSegment& a_rhs) noexcept
		{
			if (a_lhs.priority != a_rhs.priority) {
				return a_lhs.priority < a_rhs.priority;
			}
			return a_lhs.order > a_rhs.order;
		}

		void DropSegment(BudgetPass& a_pass, std::size_t a_index)
		{
			a_pass.dropped[a_index] = true;
			a_pass.total -= a_pass.segments[a_index].tokens;
		}

		bool ApplyEviction(
			BudgetPass& a_pass,
			std::uint32_t a_maxTokens,
			DropPolicy a_policy,
			const std::vector<bool>& a_preserved)
		{
			std::vector<std::size_t> candidates;
			for (std::size_t i = 0; i < a_pass.segments.size(); ++i) {
				if (!a_preserved[i] && a_pass.segments[i].tokens > 0) {
					candidates.push_back(i);
				}
			}

			const auto& segments = a_pass.segments;
			std::sort(candidates.begin(), candidates.end(), [&](std::size_t a_lhs, std::size_t a_rhs) {
				return a_policy == DropPolicy::kOldestFirst ?
				           PrecedesOldestFirst(segments[a_lhs], segments[a_rhs]) :
				           PrecedesLowestPriority(segments[a_lhs], segments[a_rhs]);
			});

			for (const auto index : candidates) {
				if (a_pass.total <= a_maxTokens) {
					break;
				}
				DropSegment(a_pass, index);
			}
			return a_pass.total <= a_maxTokens;
		}

		bool ApplyTruncateEnd(
			BudgetPass& a_pass,
			std::uint32_t a_maxTokens,
			const std::vector<bool>& a_preserved,
			const TokenEstimator& a_estimator)
		{
			for (std::size_t i = a_pass.segments.size(); i-- > 0;) {
				if (a_pass.total <= a_maxTokens) {
					break;
				}

				auto& segment = a_pass.segments[i];
				if (a_preserved[i] || segment.tokens == 0) {
					continue;
				}

				const auto rest = a_pass.total - segment.tokens;
				if (rest >= a_maxTokens) {
					DropSegment(a_pass, i);
					continue;
				}

				const auto allowance = a_maxTokens - rest;
				auto text = TruncateToTokenAllowance(segment.text, allowance, a_estimator);
				const auto tokens = a_estimator.Estimate(text);
				if (text.empty() || tokens > allowance) {
					DropSegment(a_pass, i);
					continue;
				}

				segment.text = std::move(text);
				segment.tokens = tokens;
				segment.truncated = true;
				a_pass.total = rest + tokens;
			}
			return a_pass.total <= a_maxTokens;
		}
	}

	std::string TruncateToTokenAllowance(
		std::string_view a_text,
		std::uint32_t a_allowance,
		const TokenEstimator& a_estimator)
	{
		if (a_allowance == 0 || a_text.empty()) {
			return {};
		}
		if (a_estimator.Estimate(a_text) <= a_allowance) {
			return std::string(a_text);
		}

		// Largest byte length whose boundary-aligned prefix still fits.
		std::size_t lo = 0;
		std::size_t hi = a_text.size();
		while (lo < hi) {
			const auto mid = lo + (hi - lo + 1) / 2;
			const auto cut = TextUtil::FloorUtf8Boundary(a_text, mid);
			if (a_estimator.Estimate(a_text.substr(0, cut)) <= a_allowance) {
				lo = mid;
			} else {
				hi = mid - 1;
			}
		}
		return std::string(a_text.substr(0, TextUtil::FloorUtf8Boundary(a_text, lo)));
	}

	void ApplyTokenBudget(
		Composition& a_composition,
		const TokenBudget& a_budget,
		const TokenEstimator& a_estimator)
	{
		a_composition.overBudget = false;
		if (a_composition.totalTokens <= a_budget.maxTokens) {
			return;
		}

		const auto preserveFields = ResolvePreserveFields(a_budget);
		std::vector<bool> preserved(a_composition.segments.size(), false);
		for (std::size_t i = 0; i < a_composition.segments.size(); ++i) {
			const auto& name = a_composition.segments[i].fieldName;
			preserved[i] = std::find(preserveFields.begin(), preserveFields.end(), name) != preserveFields.end();
		}

		BudgetPass pass{
			.segments = a_composition.segments,
			.dropped = std::vector<bool>(a_composition.segments.size(), false),
			.total = a_composition.totalTokens
		};

		const bool satisfied = a_budget.dropPolicy == DropPolicy::kTruncateEnd ?
		                           ApplyTruncateEnd(pass, a_budget.maxTokens, preserved, a_estimator) :
		                           ApplyEviction(pass, a_budget.maxTokens, a_budget.dropPolicy, preserved);

		if (!satisfied) {
			// Preserved content alone exceeds the budget: keep everything and flag it.
			a_composition.overBudget = true;
			spdlog::debug(
				"LoreComposer: '{}' stays over budget ({} > {} tokens) because of preserved fields.",
				a_composition.variant,
				a_composition.totalTokens,
				a_budget.maxTokens);
			return;
		}

		std::vector<PromptSegment> kept;
		std::vector<PromptSegment> dropped;
		for (std::size_t i = 0; i < pass.segments.size(); ++i) {
			if (pass.dropped[i]) {
				spdlog::debug(
					"LoreComposer: dropped segment '{}' ({} tokens, {}).",
					pass.segments[i].fieldName,
					pass.segments[i].tokens,
					DropPolicyName(a_budget.dropPolicy));
				dropped.push_back(std::move(pass.segments[i]));
				continue;
			}
			if (pass.segments[i].truncated) {
				// The cut-off segment is also reported as dropped, carrying its full original text.
				auto original = a_composition.segments[i];
				original.truncated = true;
				spdlog::debug(
					"LoreComposer: truncated segment '{}' ({} -> {} tokens).",
					original.fieldName,
					original.tokens,
					pass.segments[i].tokens);
				dropped.push_back(std::move(original));
			}
			kept.push_back(std::move(pass.segments[i]));
		}

		a_composition.segments = std::move(kept);
		a_composition.droppedSegments = std::move(dropped);
		a_composition.totalTokens = pass.total;
	}
}
