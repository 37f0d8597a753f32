#include "LoreComposer/FieldExtractor.h"

#include "LoreComposer/TextUtil.h"

#include <utility>
#include <variant>

namespace LoreComposer
{
	namespace
	{
		CardData& GetMutableCardData(CharacterProfile& a_profile) noexcept
		{
			return std::visit([](auto& a_card) -> CardData& { return a_card.data; }, a_profile);
		}

		std::string TextOrEmpty(const std::optional<std::string>& a_text)
		{
			return a_text.has_value() ? *a_text : std::string{};
		}

		std::optional<std::string>* FindTextField(CardData& a_data, std::string_view a_fieldName) noexcept
		{
			if (a_fieldName == Fields::kName) {
				return &a_data.name;
			}
			if (a_fieldName == Fields::kDescription) {
				return &a_data.description;
			}
			if (a_fieldName == Fields::kPersonality) {
				return &a_data.personality;
			}
			if (a_fieldName == Fields::kScenario) {
				return &a_data.scenario;
			}
			if (a_fieldName == Fields::kFirstMes) {
				return &a_data.firstMes;
			}
			if (a_fieldName == Fields::kMesExample) {
				return &a_data.mesExample;
			}
			if (a_fieldName == Fields::kSystemPrompt) {
				return &a_data.systemPrompt;
			}
			if (a_fieldName == Fields::kPostHistoryInstructions) {
				return &a_data.postHistoryInstructions;
			}
			if (a_fieldName == Fields::kCreatorNotes) {
				return &a_data.creatorNotes;
			}
			return nullptr;
		}

		std::vector<std::string>* FindListField(CardData& a_data, std::string_view a_fieldName) noexcept
		{
			if (a_fieldName == Fields::kAlternateGreetings) {
				return &a_data.alternateGreetings;
			}
			if (a_fieldName == Fields::kGroupOnlyGreetings) {
				return &a_data.groupOnlyGreetings;
			}
			return nullptr;
		}
	}

	const CardData& GetCardData(const CharacterProfile& a_profile) noexcept
	{
		return std::visit([](const auto& a_card) -> const CardData& { return a_card.data; }, a_profile);
	}

	const LoreBook* GetLoreBook(const CharacterProfile& a_profile) noexcept
	{
		const auto& data = GetCardData(a_profile);
		return data.characterBook.has_value() ? &*data.characterBook : nullptr;
	}

	OperationResult NormalizeProfile(
		const CharacterProfile& a_profile,
		std::vector<NamedField>& a_outFields)
	{
		const auto& data = GetCardData(a_profile);
		if (!data.name.has_value() || TextUtil::Trim(*data.name).empty()) {
			return MakeFailure(Status::kInvalidProfile, "profile is missing a non-empty 'name' field");
		}

		std::vector<NamedField> fields;
		fields.reserve(Fields::kCanonicalOrder.size());
		fields.push_back({ std::string(Fields::kName), *data.name });
		fields.push_back({ std::string(Fields::kDescription), TextOrEmpty(data.description) });
		fields.push_back({ std::string(Fields::kPersonality), TextOrEmpty(data.personality) });
		fields.push_back({ std::string(Fields::kScenario), TextOrEmpty(data.scenario) });
		fields.push_back({ std::string(Fields::kFirstMes), TextOrEmpty(data.firstMes) });
		fields.push_back({ std::string(Fields::kMesExample), TextOrEmpty(data.mesExample) });
		fields.push_back({ std::string(Fields::kSystemPrompt), TextOrEmpty(data.systemPrompt) });
		fields.push_back({ std::string(Fields::kPostHistoryInstructions), TextOrEmpty(data.postHistoryInstructions) });
		fields.push_back({ std::string(Fields::kCreatorNotes), TextOrEmpty(data.creatorNotes) });
		fields.push_back({ std::string(Fields::kAlternateGreetings), TextUtil::Join(data.alternateGreetings, Fields::kGreetingSeparator) });
		fields.push_back({ std::string(Fields::kGroupOnlyGreetings), TextUtil::Join(data.groupOnlyGreetings, Fields::kGreetingSeparator) });

		a_outFields = std::move(fields);
		return {};
	}

	OperationResult SetField(
		const CharacterProfile& a_profile,
		std::string_view a_fieldName,
		std::string a_value,
		CharacterProfile& a_outProfile)
	{
		CharacterProfile copy = a_profile;
		auto& data = GetMutableCardData(copy);

		if (auto* text = FindTextField(data, a_fieldName); text) {
			*text = std::move(a_value);
		} else if (auto* list = FindListField(data, a_fieldName); list) {
			list->clear();
			if (!a_value.empty()) {
				list->push_back(std::move(a_value));
			}
		} else {
			return MakeFailure(Status::kUnknownField, "unknown profile field '" + std::string(a_fieldName) + "'");
		}

		a_outProfile = std::move(copy);
		return {};
	}
}
