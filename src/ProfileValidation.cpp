#include "LoreComposer/ProfileValidation.h"

#include "LoreComposer/FieldExtractor.h"
#include "LoreComposer/TextUtil.h"

#include <unordered_map>
#include <utility>

namespace LoreComposer
{
	namespace
	{
		std::string EntryPath(std::size_t a_index)
		{
			return "character_book.entries[" + std::to_string(a_index) + "]";
		}

		void AddIssue(
			ValidationReport& a_report,
			std::string a_field,
			std::string a_message,
			IssueSeverity a_severity)
		{
			if (a_severity == IssueSeverity::kError) {
				a_report.valid = false;
			}
			a_report.issues.push_back(ValidationIssue{
				.field = std::move(a_field),
				.message = std::move(a_message),
				.severity = a_severity });
		}

		void ValidateEntry(
			ValidationReport& a_report,
			const LoreEntry& a_entry,
			std::size_t a_index,
			const RegexLimits& a_limits)
		{
			const auto path = EntryPath(a_index);

			bool hasKey = false;
			for (const auto& key : a_entry.keys) {
				if (!TextUtil::Trim(key).empty()) {
					hasKey = true;
					break;
				}
			}
			if (!hasKey && !a_entry.constant) {
				AddIssue(a_report, path + ".keys", "entry has no keys and is not constant; it can never activate", IssueSeverity::kError);
			}

			if (TextUtil::Trim(a_entry.content).empty()) {
				AddIssue(a_report, path + ".content", "entry content is empty", IssueSeverity::kWarning);
			}

			if (a_entry.selectiveLogic != SelectiveLogic::kNone && a_entry.secondaryKeys.empty()) {
				AddIssue(
					a_report,
					path + ".secondary_keys",
					"selective entry has no secondary keys",
					IssueSeverity::kWarning);
			}

			if (a_entry.probability < 0 || a_entry.probability > kMaxProbability) {
				AddIssue(
					a_report,
					path + ".probability",
					"probability " + std::to_string(a_entry.probability) + " is outside 0-100 and will be clamped",
					IssueSeverity::kWarning);
			}

			if (a_entry.useRegex) {
				const auto checkKeys = [&](const std::vector<std::string>& a_keys, std::string_view a_listName) {
					for (std::size_t k = 0; k < a_keys.size(); ++k) {
						const auto error = CheckRegexKey(a_keys[k], a_limits);
						if (error != RegexKeyError::kNone) {
							AddIssue(
								a_report,
								path + "." + std::string(a_listName) + "[" + std::to_string(k) + "]",
								"regex key rejected (" + std::string(RegexKeyErrorName(error)) + "); it will never match",
								IssueSeverity::kWarning);
						}
					}
				};
				checkKeys(a_entry.keys, "keys");
				checkKeys(a_entry.secondaryKeys, "secondary_keys");
			}

			if (!a_entry.enabled) {
				AddIssue(a_report, path + ".enabled", "entry is disabled", IssueSeverity::kInfo);
			}
		}
	}

	ValidationReport ValidateProfile(const CharacterProfile& a_profile, const RegexLimits& a_limits)
	{
		ValidationReport report{};
		const auto& data = GetCardData(a_profile);

		if (!data.name.has_value() || TextUtil::Trim(*data.name).empty()) {
			AddIssue(report, std::string(Fields::kName), "character name is required", IssueSeverity::kError);
		}
		if (!data.description.has_value() || TextUtil::Trim(*data.description).empty()) {
			AddIssue(report, std::string(Fields::kDescription), "description is empty", IssueSeverity::kWarning);
		}
		if (!data.firstMes.has_value() || TextUtil::Trim(*data.firstMes).empty()) {
			AddIssue(
				report,
				std::string(Fields::kFirstMes),
				"first message is empty; lore activation has no default probe text",
				IssueSeverity::kWarning);
		}

		const auto* book = GetLoreBook(a_profile);
		if (!book) {
			return report;
		}

		std::unordered_map<std::int64_t, std::size_t> firstIndexById;
		for (std::size_t i = 0; i < book->entries.size(); ++i) {
			const auto& entry = book->entries[i];
			const auto [it, inserted] = firstIndexById.emplace(entry.id, i);
			if (!inserted) {
				AddIssue(
					report,
					EntryPath(i) + ".id",
					"duplicate entry id " + std::to_string(entry.id) + " (first used by entry " + std::to_string(it->second) + ")",
					IssueSeverity::kError);
			}
			ValidateEntry(report, entry, i, a_limits);
		}

		if (book->entries.empty()) {
			AddIssue(report, "character_book.entries", "lorebook has no entries", IssueSeverity::kInfo);
		}
		return report;
	}
}
