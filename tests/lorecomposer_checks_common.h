#pragma once

#include "LoreComposer/CharacterProfile.h"
#include "LoreComposer/LoreBook.h"
#include "LoreComposer/TokenEstimator.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace LoreComposerChecks
{
	bool CheckKeyCaseSensitivity();
	bool CheckSelectiveLogic();
	bool CheckConstantEntriesWithEmptyInput();
	bool CheckRecursiveScanning();
	bool CheckCycleTermination();
	bool CheckActivationPriorityOrdering();
	bool CheckScanDepthWindow();
	bool CheckProbabilityDeterminism();
	bool CheckRegexKeys();
	bool CheckDuplicateEntryIds();
	bool CheckTriggerTestPreview();
	bool CheckEntryStats();
	bool CheckConcurrentActivation();

	bool CheckTokenizerRegistry();
	bool CheckVariantSections();
	bool CheckComposeIdempotence();
	bool CheckSegmentAssemblyOrder();
	bool CheckTruncateEndBudget();
	bool CheckOldestFirstBudget();
	bool CheckLowestPriorityBudget();
	bool CheckPreservedFieldsOverBudget();
	bool CheckTruncateToTokenAllowance();
	bool CheckPreviewFieldChange();
	bool CheckCompareVariants();
	bool CheckConcurrentComposition();

	bool CheckParseTaggedCard();
	bool CheckParseLegacyCard();
	bool CheckParseRejectsMalformedCards();
	bool CheckNormalizeAndSetField();
	bool CheckProfileValidation();
	bool CheckEngineSettings();
	bool CheckResultJson();

	// One token per byte, so budget arithmetic in the checks is exact.
	inline const LoreComposer::TokenEstimator& ByteEstimator()
	{
		static const LoreComposer::FunctionTokenEstimator estimator(
			"bytes",
			[](std::string_view a_text) { return static_cast<std::uint32_t>(a_text.size()); });
		return estimator;
	}

	inline LoreComposer::LoreEntry MakeEntry(
		std::int64_t a_id,
		std::vector<std::string> a_keys,
		std::string a_content)
	{
		LoreComposer::LoreEntry entry{};
		entry.id = a_id;
		entry.keys = std::move(a_keys);
		entry.content = std::move(a_content);
		entry.insertionOrder = static_cast<std::int32_t>(a_id);
		return entry;
	}

	inline LoreComposer::CharacterProfile MakeProfile(
		std::string a_name,
		LoreComposer::CardData a_data,
		std::vector<LoreComposer::LoreEntry> a_entries = {},
		bool a_recursive = false)
	{
		a_data.name = std::move(a_name);
		if (!a_entries.empty()) {
			LoreComposer::LoreBook book{};
			book.entries = std::move(a_entries);
			book.recursiveScanning = a_recursive;
			a_data.characterBook = std::move(book);
		}
		return LoreComposer::TaggedCard{ .data = std::move(a_data) };
	}

	inline std::vector<std::int64_t> ActivatedIds(const std::vector<const LoreComposer::LoreEntry*>& a_entries)
	{
		std::vector<std::int64_t> ids;
		ids.reserve(a_entries.size());
		for (const auto* entry : a_entries) {
			ids.push_back(entry->id);
		}
		return ids;
	}
}
