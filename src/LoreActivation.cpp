#include "LoreComposer/LoreActivation.h"

#include "LoreComposer/ActivationRoll.h"
#include "LoreComposer/EntryOrdering.h"
#include "LoreComposer/KeyMatching.h"
#include "LoreComposer/TokenEstimator.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace LoreComposer
{
	namespace
	{
		struct KeyMatcher
		{
			std::string key{};
			std::optional<CompiledRegexKey> regex{};
			bool usable{ true };
		};

		struct PreparedEntry
		{
			const LoreEntry* entry{ nullptr };
			std::uint32_t index{ 0 };
			std::vector<KeyMatcher> primary{};
			std::vector<KeyMatcher> secondary{};
		};

		struct EntryMatch
		{
			bool matched{ false };
			std::vector<std::string> primary{};
			std::vector<std::string> secondary{};
		};

		std::vector<KeyMatcher> PrepareKeys(
			const LoreEntry& a_entry,
			const std::vector<std::string>& a_keys,
			const RegexLimits& a_limits)
		{
			std::vector<KeyMatcher> out;
			out.reserve(a_keys.size());
			for (const auto& key : a_keys) {
				KeyMatcher matcher{ .key = key };
				if (a_entry.useRegex) {
					RegexKeyError error = RegexKeyError::kNone;
					matcher.regex = CompiledRegexKey::Compile(key, a_entry.caseSensitive, a_limits, error);
					if (!matcher.regex.has_value()) {
						matcher.usable = false;
						spdlog::warn(
							"LoreComposer: lore entry #{} regex key '{}' rejected ({}); key disabled for this scan.",
							a_entry.id,
							key,
							RegexKeyErrorName(error));
					}
				}
				out.push_back(std::move(matcher));
			}
			return out;
		}

		[[nodiscard]] bool KeyMatches(const KeyMatcher& a_matcher, std::string_view a_window, bool a_caseSensitive)
		{
			if (!a_matcher.usable) {
				return false;
			}
			if (a_matcher.regex.has_value()) {
				return a_matcher.regex->Search(a_window);
			}
			return detail::ContainsLiteralKey(a_window, a_matcher.key, a_caseSensitive);
		}

		[[nodiscard]] EntryMatch EvaluateEntry(const PreparedEntry& a_prepared, std::string_view a_window)
		{
			EntryMatch out{};
			const auto& entry = *a_prepared.entry;

			for (const auto& matcher : a_prepared.primary) {
				if (KeyMatches(matcher, a_window, entry.caseSensitive)) {
					out.primary.push_back(matcher.key);
				}
			}
			if (out.primary.empty()) {
				return out;
			}

			for (const auto& matcher : a_prepared.secondary) {
				if (KeyMatches(matcher, a_window, entry.caseSensitive)) {
					out.secondary.push_back(matcher.key);
				}
			}

			out.matched = detail::PassesSelectiveLogic(
				entry.selectiveLogic,
				!a_prepared.secondary.empty(),
				!out.secondary.empty());
			return out;
		}

		std::vector<PreparedEntry> PrepareEntries(const LoreBook& a_book, const RegexLimits& a_limits)
		{
			std::vector<PreparedEntry> prepared;
			prepared.reserve(a_book.entries.size());

			std::unordered_set<std::int64_t> seenIds;
			seenIds.reserve(a_book.entries.size() * 2);

			for (std::size_t i = 0; i < a_book.entries.size(); ++i) {
				const auto& entry = a_book.entries[i];
				if (!seenIds.insert(entry.id).second) {
					spdlog::warn("LoreComposer: duplicate lore entry id #{} skipped.", entry.id);
					continue;
				}
				if (!entry.enabled) {
					continue;
				}

				PreparedEntry item{ .entry = &entry, .index = static_cast<std::uint32_t>(i) };
				if (!entry.constant) {
					item.primary = PrepareKeys(entry, entry.keys, a_limits);
					item.secondary = PrepareKeys(entry, entry.secondaryKeys, a_limits);
				}
				prepared.push_back(std::move(item));
			}
			return prepared;
		}
	}

	std::optional<std::uint32_t> ResolveScanDepth(
		const LoreBook& a_book,
		const ActivationOptions& a_options) noexcept
	{
		if (a_options.scanDepth.has_value()) {
			return a_options.scanDepth;
		}
		return a_book.scanDepth;
	}

	std::string BuildScanWindow(
		std::string_view a_input,
		const std::vector<std::string>& a_history,
		std::optional<std::uint32_t> a_scanDepth)
	{
		std::size_t first = 0;
		if (a_scanDepth.has_value()) {
			const auto depth = std::min<std::size_t>(*a_scanDepth, a_history.size());
			first = a_history.size() - depth;
		}

		std::string window;
		for (std::size_t i = first; i < a_history.size(); ++i) {
			window.append(a_history[i]);
			window.push_back('\n');
		}
		window.append(a_input);
		return window;
	}

	ActivationOutcome ActivateEntries(
		const LoreBook& a_book,
		std::string_view a_input,
		const std::vector<std::string>& a_history,
		const ActivationOptions& a_options)
	{
		ActivationOutcome out{};

		const auto prepared = PrepareEntries(a_book, a_options.regex);
		std::string window = BuildScanWindow(a_input, a_history, ResolveScanDepth(a_book, a_options));

		// A pass that continues the scan activated at least one entry, and no entry activates
		// twice, so entries.size() passes always suffice.
		const auto maxPasses = static_cast<std::uint32_t>(std::max<std::size_t>(1, a_book.entries.size()));

		std::vector<bool> settled(prepared.size(), false);
		std::vector<ActivationResult> results;

		for (std::uint32_t pass = 1; pass <= maxPasses; ++pass) {
			std::vector<std::size_t> fresh;

			for (std::size_t i = 0; i < prepared.size(); ++i) {
				if (settled[i]) {
					continue;
				}

				const auto& item = prepared[i];
				const auto& entry = *item.entry;

				if (entry.constant) {
					settled[i] = true;
					fresh.push_back(i);
					results.push_back(ActivationResult{
						.entry = &entry,
						.entryIndex = item.index,
						.reason = ActivationReason::kConstant,
						.pass = pass });
					continue;
				}

				auto match = EvaluateEntry(item, window);
				if (!match.matched) {
					continue;
				}

				settled[i] = true;
				if (!RollActivationChance(a_options.seed, entry.id, entry.probability)) {
					spdlog::debug(
						"LoreComposer: lore entry #{} matched but failed its probability draw ({}%).",
						entry.id,
						entry.probability);
					continue;
				}

				fresh.push_back(i);
				results.push_back(ActivationResult{
					.entry = &entry,
					.entryIndex = item.index,
					.matchedKeys = std::move(match.primary),
					.matchedSecondaryKeys = std::move(match.secondary),
					.reason = pass == 1 ? ActivationReason::kKeyMatch : ActivationReason::kRecursive,
					.pass = pass });
			}

			out.passes = pass;
			spdlog::debug("LoreComposer: activation pass {} activated {} entries.", pass, fresh.size());

			if (fresh.empty() || !a_book.recursiveScanning) {
				break;
			}
			for (const auto idx : fresh) {
				window.push_back('\n');
				window.append(prepared[idx].entry->content);
			}
		}

		std::sort(results.begin(), results.end(), [](const ActivationResult& a_lhs, const ActivationResult& a_rhs) {
			return PrecedesInActivationOrder(MakeEntryOrderKey(*a_lhs.entry), MakeEntryOrderKey(*a_rhs.entry));
		});

		for (const auto& result : results) {
			if (result.entry->position == LorePosition::kAfterChar) {
				out.afterGroup.push_back(result.entry);
			} else {
				out.beforeGroup.push_back(result.entry);
			}
		}
		out.activations = std::move(results);
		return out;
	}

	TriggerTestResult TestInput(
		std::string_view a_input,
		const LoreBook* a_book,
		const std::vector<std::string>& a_history,
		const ActivationOptions& a_options,
		const TokenEstimator& a_estimator)
	{
		TriggerTestResult out{};
		if (!a_book) {
			return out;
		}

		out.outcome = ActivateEntries(*a_book, a_input, a_history, a_options);

		std::vector<std::string> parts;
		parts.reserve(out.outcome.beforeGroup.size() + out.outcome.afterGroup.size());
		for (const auto* entry : out.outcome.beforeGroup) {
			parts.push_back(entry->content);
		}
		for (const auto* entry : out.outcome.afterGroup) {
			parts.push_back(entry->content);
		}

		for (std::size_t i = 0; i < parts.size(); ++i) {
			if (i > 0) {
				out.injectionPreview.append("\n\n");
			}
			out.injectionPreview.append(parts[i]);
		}
		out.totalTokens = a_estimator.Estimate(out.injectionPreview);
		return out;
	}
}
