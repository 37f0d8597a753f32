#include "lorecomposer_checks_common.h"

#include "LoreComposer/LoreActivation.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <thread>

namespace LoreComposerChecks
{
	using namespace LoreComposer;

	namespace
	{
		std::vector<std::int64_t> ActivatedIds(const ActivationOutcome& a_outcome)
		{
			std::vector<std::int64_t> ids;
			for (const auto& activation : a_outcome.activations) {
				ids.push_back(activation.entry->id);
			}
			return ids;
		}

		bool IsActive(const ActivationOutcome& a_outcome, std::int64_t a_id)
		{
			const auto ids = ActivatedIds(a_outcome);
			return std::find(ids.begin(), ids.end(), a_id) != ids.end();
		}

		LoreBook MakeBook(std::vector<LoreEntry> a_entries, bool a_recursive = false)
		{
			LoreBook book{};
			book.entries = std::move(a_entries);
			book.recursiveScanning = a_recursive;
			return book;
		}
	}

	bool CheckKeyCaseSensitivity()
	{
		auto sensitive = MakeEntry(1, { "Dragon" }, "Dragons hoard gold.");
		sensitive.caseSensitive = true;
		const auto loose = MakeEntry(2, { "Dragon" }, "Dragons fly.");
		const auto book = MakeBook({ sensitive, loose });

		const auto lower = ActivateEntries(book, "a dragon appears", {}, {});
		if (IsActive(lower, 1) || !IsActive(lower, 2)) {
			std::cerr << "activation: case-sensitive key matched different casing\n";
			return false;
		}

		const auto exact = ActivateEntries(book, "a Dragon appears", {}, {});
		if (!IsActive(exact, 1) || !IsActive(exact, 2)) {
			std::cerr << "activation: expected exact casing to activate both entries\n";
			return false;
		}

		const auto shouted = ActivateEntries(book, "A DRAGON APPEARS", {}, {});
		if (IsActive(shouted, 1) || !IsActive(shouted, 2)) {
			std::cerr << "activation: expected only the case-insensitive entry for upper-case input\n";
			return false;
		}

		const auto& match = exact.activations.front();
		if (match.reason != ActivationReason::kKeyMatch || match.matchedKeys != std::vector<std::string>{ "Dragon" }) {
			std::cerr << "activation: expected key-match reason with the matched key recorded\n";
			return false;
		}
		return true;
	}

	bool CheckSelectiveLogic()
	{
		auto andEntry = MakeEntry(1, { "castle" }, "The castle gates close at dusk.");
		andEntry.secondaryKeys = { "night", "dusk" };
		andEntry.selectiveLogic = SelectiveLogic::kAnd;

		auto notEntry = MakeEntry(2, { "castle" }, "The castle market is busy.");
		notEntry.secondaryKeys = { "night" };
		notEntry.selectiveLogic = SelectiveLogic::kNot;

		const auto book = MakeBook({ andEntry, notEntry });

		const auto primaryOnly = ActivateEntries(book, "we reach the castle", {}, {});
		if (IsActive(primaryOnly, 1) || !IsActive(primaryOnly, 2)) {
			std::cerr << "selective: primary-only input must skip AND and pass NOT\n";
			return false;
		}

		const auto both = ActivateEntries(book, "we reach the castle at night", {}, {});
		if (!IsActive(both, 1) || IsActive(both, 2)) {
			std::cerr << "selective: primary plus secondary must pass AND and skip NOT\n";
			return false;
		}
		if (both.activations.front().matchedSecondaryKeys != std::vector<std::string>{ "night" }) {
			std::cerr << "selective: expected matched secondary key to be recorded\n";
			return false;
		}

		const auto secondaryOnly = ActivateEntries(book, "it is night", {}, {});
		if (!secondaryOnly.activations.empty()) {
			std::cerr << "selective: secondary keys alone must not activate anything\n";
			return false;
		}
		return true;
	}

	bool CheckConstantEntriesWithEmptyInput()
	{
		auto constant = MakeEntry(1, {}, "The world is ending.");
		constant.constant = true;
		auto disabledConstant = MakeEntry(2, {}, "Never shown.");
		disabledConstant.constant = true;
		disabledConstant.enabled = false;
		auto disabledKeyed = MakeEntry(3, { "world" }, "Also never shown.");
		disabledKeyed.enabled = false;

		const auto book = MakeBook({ constant, disabledConstant, disabledKeyed });
		const auto outcome = ActivateEntries(book, "", {}, {});

		if (outcome.activations.size() != 1 || outcome.activations.front().entry->id != 1) {
			std::cerr << "constant: expected exactly the enabled constant entry for empty input\n";
			return false;
		}
		if (outcome.activations.front().reason != ActivationReason::kConstant) {
			std::cerr << "constant: expected constant reason\n";
			return false;
		}

		const auto mentioned = ActivateEntries(book, "the world", {}, {});
		if (IsActive(mentioned, 3)) {
			std::cerr << "constant: disabled entry activated\n";
			return false;
		}
		return true;
	}

	bool CheckRecursiveScanning()
	{
		const auto alpha = MakeEntry(1, { "alpha" }, "Alpha serves the beta order.");
		const auto beta = MakeEntry(2, { "beta" }, "Beta is an old order.");
		const auto gamma = MakeEntry(3, { "gamma" }, "Unrelated.");

		const auto flat = ActivateEntries(MakeBook({ alpha, beta, gamma }, false), "tell me about alpha", {}, {});
		if (ActivatedIds(flat) != std::vector<std::int64_t>{ 1 } || flat.passes != 1) {
			std::cerr << "recursion: disabled recursion must only activate the directly matched entry\n";
			return false;
		}

		const auto recursiveBook = MakeBook({ alpha, beta, gamma }, true);
		const auto deep = ActivateEntries(recursiveBook, "tell me about alpha", {}, {});
		if (!IsActive(deep, 1) || !IsActive(deep, 2) || IsActive(deep, 3)) {
			std::cerr << "recursion: expected alpha to pull in beta only\n";
			return false;
		}
		for (const auto& activation : deep.activations) {
			if (activation.entry->id == 2 && (activation.reason != ActivationReason::kRecursive || activation.pass != 2)) {
				std::cerr << "recursion: expected beta to be a pass-2 recursive activation\n";
				return false;
			}
		}
		return true;
	}

	bool CheckCycleTermination()
	{
		constexpr std::int64_t kCount = 8;
		std::vector<LoreEntry> entries;
		for (std::int64_t i = 0; i < kCount; ++i) {
			std::string content;
			for (std::int64_t j = 0; j < kCount; ++j) {
				content += "key" + std::to_string(j) + " ";
			}
			entries.push_back(MakeEntry(i, { "key" + std::to_string(i) }, content));
		}

		// Every entry mentions every key, so each pass re-triggers the whole book.
		const auto book = MakeBook(std::move(entries), true);
		const auto outcome = ActivateEntries(book, "key0", {}, {});

		if (outcome.activations.size() != static_cast<std::size_t>(kCount)) {
			std::cerr << "cycle: expected every entry to activate exactly once, got " << outcome.activations.size() << '\n';
			return false;
		}
		if (outcome.passes == 0 || outcome.passes > static_cast<std::uint32_t>(kCount)) {
			std::cerr << "cycle: pass count " << outcome.passes << " exceeds entry count\n";
			return false;
		}

		auto ids = ActivatedIds(outcome);
		std::sort(ids.begin(), ids.end());
		if (std::adjacent_find(ids.begin(), ids.end()) != ids.end()) {
			std::cerr << "cycle: an entry activated twice\n";
			return false;
		}
		return true;
	}

	bool CheckActivationPriorityOrdering()
	{
		auto low = MakeEntry(1, { "x" }, "low");
		low.priority = 5;
		low.insertionOrder = 0;
		auto high = MakeEntry(2, { "x" }, "high");
		high.priority = 10;
		high.insertionOrder = 50;
		auto lowEarlier = MakeEntry(3, { "x" }, "low earlier");
		lowEarlier.priority = 5;
		lowEarlier.insertionOrder = -1;
		auto after = MakeEntry(4, { "x" }, "after");
		after.priority = 20;
		after.position = LorePosition::kAfterChar;

		const auto outcome = ActivateEntries(MakeBook({ low, high, lowEarlier, after }), "x", {}, {});
		if (ActivatedIds(outcome) != std::vector<std::int64_t>{ 4, 2, 3, 1 }) {
			std::cerr << "ordering: expected priority desc then insertion_order asc\n";
			return false;
		}
		if (ActivatedIds(outcome.beforeGroup) != std::vector<std::int64_t>{ 2, 3, 1 } ||
			ActivatedIds(outcome.afterGroup) != std::vector<std::int64_t>{ 4 }) {
			std::cerr << "ordering: position groups must keep the sorted order\n";
			return false;
		}
		return true;
	}

	bool CheckScanDepthWindow()
	{
		const std::vector<std::string> history{ "a dragon lands", "quiet", "still quiet" };
		LoreBook book = MakeBook({ MakeEntry(1, { "dragon" }, "Dragon lore.") });

		if (!IsActive(ActivateEntries(book, "nothing", history, {}), 1)) {
			std::cerr << "scan depth: unset depth must scan the full history\n";
			return false;
		}

		ActivationOptions shallow{};
		shallow.scanDepth = 2;
		if (IsActive(ActivateEntries(book, "nothing", history, shallow), 1)) {
			std::cerr << "scan depth: depth 2 must not see the oldest turn\n";
			return false;
		}

		book.scanDepth = 1;
		if (IsActive(ActivateEntries(book, "nothing", history, {}), 1)) {
			std::cerr << "scan depth: book scan_depth must apply when options leave it unset\n";
			return false;
		}

		ActivationOptions deep{};
		deep.scanDepth = 3;
		if (!IsActive(ActivateEntries(book, "nothing", history, deep), 1)) {
			std::cerr << "scan depth: explicit depth must override the book\n";
			return false;
		}

		if (BuildScanWindow("now", history, 1) != "still quiet\nnow") {
			std::cerr << "scan depth: unexpected window text\n";
			return false;
		}
		return true;
	}

	bool CheckProbabilityDeterminism()
	{
		std::vector<LoreEntry> entries;
		for (std::int64_t i = 0; i < 64; ++i) {
			auto entry = MakeEntry(i, { "coin" }, "flip " + std::to_string(i));
			entry.probability = 50;
			entries.push_back(std::move(entry));
		}
		auto certain = MakeEntry(100, { "coin" }, "always");
		certain.probability = 100;
		auto never = MakeEntry(101, { "coin" }, "never");
		never.probability = 0;
		entries.push_back(certain);
		entries.push_back(never);
		const auto book = MakeBook(std::move(entries));

		ActivationOptions options{};
		options.seed = 0xC0FFEEull;
		const auto first = ActivateEntries(book, "coin", {}, options);
		const auto second = ActivateEntries(book, "coin", {}, options);
		if (ActivatedIds(first) != ActivatedIds(second)) {
			std::cerr << "probability: identical seeded calls diverged\n";
			return false;
		}
		if (!IsActive(first, 100) || IsActive(first, 101)) {
			std::cerr << "probability: 100 must always pass and 0 must never pass\n";
			return false;
		}
		if (first.activations.size() < 10 || first.activations.size() > 60) {
			std::cerr << "probability: implausible number of 50% activations: " << first.activations.size() << '\n';
			return false;
		}

		options.seed = 7;
		const auto reseeded = ActivateEntries(book, "coin", {}, options);
		if (ActivatedIds(reseeded) == ActivatedIds(first)) {
			std::cerr << "probability: a different seed produced the identical draw set\n";
			return false;
		}
		return true;
	}

	bool CheckRegexKeys()
	{
		auto slashForm = MakeEntry(1, { "/drag(on|oon)s?/i" }, "regex hit");
		slashForm.useRegex = true;
		slashForm.caseSensitive = true;

		auto pathological = MakeEntry(2, { "(a+)+$", "knight" }, "second key still works");
		pathological.useRegex = true;

		auto broken = MakeEntry(3, { "([unclosed" }, "never");
		broken.useRegex = true;

		auto backref = MakeEntry(4, { "(x)\\1" }, "never");
		backref.useRegex = true;

		const auto book = MakeBook({ slashForm, pathological, broken, backref });
		const auto outcome = ActivateEntries(book, "A DRAGOON and a knight, aaaaaaaaaaaaaaaaaaaaaaaaaaaaab xx", {}, {});

		if (!IsActive(outcome, 1)) {
			std::cerr << "regex: /pattern/i key did not match case-insensitively\n";
			return false;
		}
		if (!IsActive(outcome, 2)) {
			std::cerr << "regex: a rejected key must not disable the entry's other keys\n";
			return false;
		}
		if (IsActive(outcome, 3) || IsActive(outcome, 4)) {
			std::cerr << "regex: invalid keys must never match\n";
			return false;
		}

		ActivationOptions tight{};
		tight.regex.maxWindowBytes = 8;
		auto tail = MakeEntry(5, { "^start" }, "window cap");
		tail.useRegex = true;
		const auto capped = ActivateEntries(MakeBook({ tail }), "start of a long window", {}, tight);
		if (IsActive(capped, 5)) {
			std::cerr << "regex: search must be limited to the trailing window bytes\n";
			return false;
		}

		// Trimming to 8 bytes would land inside the first "é"; the search starts at the next one.
		auto accented = MakeEntry(6, { "^\xC3\xA9\xC3\xA9" }, "utf-8 boundary");
		accented.useRegex = true;
		accented.caseSensitive = true;
		const auto boundary = ActivateEntries(MakeBook({ accented }), "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9" "a", {}, tight);
		if (!IsActive(boundary, 6)) {
			std::cerr << "regex: trailing window must start on a UTF-8 code point boundary\n";
			return false;
		}

		// Repeated alternation would overflow the stack or backtrack without end; both keys are
		// refused, and a plain repetition over a long window only ever sees the capped tail.
		std::string alternating;
		for (std::size_t i = 0; i < 60000; ++i) {
			alternating.push_back(i % 2 == 0 ? 'x' : 'y');
		}
		auto recursive = MakeEntry(7, { "(x|y)*z" }, "never");
		recursive.useRegex = true;
		auto overlapping = MakeEntry(8, { "(a|aa)+b" }, "never");
		overlapping.useRegex = true;
		auto repeated = MakeEntry(9, { "y+z$" }, "long tail");
		repeated.useRegex = true;
		const auto hostile = ActivateEntries(
			MakeBook({ recursive, overlapping }),
			alternating + "z " + std::string(40, 'a'),
			{},
			{});
		if (IsActive(hostile, 7) || IsActive(hostile, 8)) {
			std::cerr << "regex: repeated alternation keys must be rejected\n";
			return false;
		}

		const auto longTail = ActivateEntries(MakeBook({ repeated }), std::string(60000, 'y') + "z", {}, {});
		if (!IsActive(longTail, 9)) {
			std::cerr << "regex: repetition over a long window must finish and match its tail\n";
			return false;
		}
		return true;
	}

	bool CheckDuplicateEntryIds()
	{
		const auto first = MakeEntry(7, { "twin" }, "first");
		const auto second = MakeEntry(7, { "twin" }, "second");
		const auto outcome = ActivateEntries(MakeBook({ first, second }), "twin", {}, {});

		if (outcome.activations.size() != 1 || outcome.activations.front().entry->content != "first") {
			std::cerr << "duplicates: expected only the first entry with a repeated id\n";
			return false;
		}
		return true;
	}

	bool CheckTriggerTestPreview()
	{
		auto before = MakeEntry(1, { "inn" }, "The inn is warm.");
		auto after = MakeEntry(2, { "inn" }, "Keep answers short.");
		after.position = LorePosition::kAfterChar;
		after.priority = 50;
		const auto book = MakeBook({ before, after });

		const auto result = TestInput("we enter the inn", &book, {}, {}, ByteEstimator());
		if (result.injectionPreview != "The inn is warm.\n\nKeep answers short.") {
			std::cerr << "trigger test: before group must precede after group in the preview\n";
			return false;
		}
		if (result.totalTokens != result.injectionPreview.size()) {
			std::cerr << "trigger test: preview tokens must come from the estimator\n";
			return false;
		}

		const auto none = TestInput("we enter the inn", nullptr, {}, {}, ByteEstimator());
		if (!none.outcome.activations.empty() || !none.injectionPreview.empty() || none.totalTokens != 0) {
			std::cerr << "trigger test: a missing book must yield an empty result\n";
			return false;
		}
		return true;
	}

	bool CheckEntryStats()
	{
		auto a = MakeEntry(1, { "a" }, "a");
		a.priority = 10;
		auto b = MakeEntry(2, { "b" }, "b");
		b.enabled = false;
		b.position = LorePosition::kAfterChar;
		auto c = MakeEntry(3, {}, "c");
		c.constant = true;
		c.useRegex = true;
		c.priority = 2;
		c.selectiveLogic = SelectiveLogic::kNot;
		const auto book = MakeBook({ a, b, c });

		const auto stats = GetEntryStats(&book);
		if (stats.total != 3 || stats.enabled != 2 || stats.disabled != 1 || stats.constant != 1 ||
			stats.beforeChar != 2 || stats.afterChar != 1 || stats.selective != 1 || stats.regex != 1 ||
			stats.averagePriority != 4.0) {
			std::cerr << "stats: unexpected summary\n";
			return false;
		}

		const auto empty = GetEntryStats(nullptr);
		if (empty.total != 0 || empty.averagePriority != 0.0) {
			std::cerr << "stats: a missing book must report zeros\n";
			return false;
		}
		return true;
	}

	bool CheckConcurrentActivation()
	{
		std::vector<LoreEntry> entries;
		for (std::int64_t i = 0; i < 32; ++i) {
			auto entry = MakeEntry(i, { "rune" + std::to_string(i % 4) }, "rune" + std::to_string((i + 1) % 4));
			entry.probability = 70;
			entry.priority = static_cast<std::int32_t>(i % 3);
			entries.push_back(std::move(entry));
		}
		const auto book = MakeBook(std::move(entries), true);

		ActivationOptions options{};
		options.seed = 99;
		const auto expected = ActivatedIds(ActivateEntries(book, "rune0", {}, options));

		constexpr std::size_t kThreads = 4;
		std::vector<std::vector<std::int64_t>> results(kThreads);
		std::vector<std::thread> workers;
		for (std::size_t t = 0; t < kThreads; ++t) {
			workers.emplace_back([&, t] {
				for (int round = 0; round < 20; ++round) {
					results[t] = ActivatedIds(ActivateEntries(book, "rune0", {}, options));
				}
			});
		}
		for (auto& worker : workers) {
			worker.join();
		}

		for (const auto& result : results) {
			if (result != expected) {
				std::cerr << "concurrency: parallel activation diverged from the serial result\n";
				return false;
			}
		}
		return true;
	}
}
