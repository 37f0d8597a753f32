#include "LoreComposer/ProfileJson.h"

#include "LoreComposer/JsonFile.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace LoreComposer
{
	namespace
	{
		// Typed accessors over one JSON object. Absent and null keys leave the output alone; a
		// present key of the wrong type records an error and returns false.
		class ObjectReader
		{
		public:
			ObjectReader(const nlohmann::json& a_object, std::string a_path) :
				_object(a_object),
				_path(std::move(a_path))
			{}

			[[nodiscard]] const std::string& Error() const noexcept { return _error; }

			bool Text(const char* a_key, std::optional<std::string>& a_out)
			{
				const auto* value = Find(a_key);
				if (!value) {
					return true;
				}
				if (!value->is_string()) {
					return Fail(a_key, "a string");
				}
				a_out = value->get<std::string>();
				return true;
			}

			bool Text(const char* a_key, std::string& a_out)
			{
				std::optional<std::string> text;
				if (!Text(a_key, text)) {
					return false;
				}
				if (text) {
					a_out = std::move(*text);
				}
				return true;
			}

			bool Flag(const char* a_key, bool& a_out)
			{
				const auto* value = Find(a_key);
				if (!value) {
					return true;
				}
				if (!value->is_boolean()) {
					return Fail(a_key, "a boolean");
				}
				a_out = value->get<bool>();
				return true;
			}

			bool Integer(const char* a_key, std::int64_t& a_out)
			{
				const auto* value = Find(a_key);
				if (!value) {
					return true;
				}
				if (!value->is_number()) {
					return Fail(a_key, "a number");
				}
				const auto number = value->get<double>();
				if (!std::isfinite(number)) {
					return Fail(a_key, "a finite number");
				}
				if (value->is_number_integer() && !value->is_number_unsigned()) {
					a_out = value->get<std::int64_t>();
					return true;
				}

				constexpr auto kLow = static_cast<double>(std::numeric_limits<std::int64_t>::min());
				constexpr auto kHigh = static_cast<double>(std::numeric_limits<std::int64_t>::max());
				if (number >= kHigh) {
					a_out = std::numeric_limits<std::int64_t>::max();
				} else if (number <= kLow) {
					a_out = std::numeric_limits<std::int64_t>::min();
				} else {
					a_out = static_cast<std::int64_t>(std::trunc(number));
				}
				return true;
			}

			bool Integer(const char* a_key, std::int32_t& a_out)
			{
				std::int64_t wide = a_out;
				if (!Integer(a_key, wide)) {
					return false;
				}
				a_out = static_cast<std::int32_t>(std::clamp<std::int64_t>(
					wide,
					std::numeric_limits<std::int32_t>::min(),
					std::numeric_limits<std::int32_t>::max()));
				return true;
			}

			bool Integer(const char* a_key, std::optional<std::int32_t>& a_out)
			{
				if (!Find(a_key)) {
					return true;
				}
				std::int32_t value = 0;
				if (!Integer(a_key, value)) {
					return false;
				}
				a_out = value;
				return true;
			}

			bool Count(const char* a_key, std::optional<std::uint32_t>& a_out)
			{
				if (!Find(a_key)) {
					return true;
				}
				std::int64_t value = 0;
				if (!Integer(a_key, value)) {
					return false;
				}
				if (value < 0) {
					return Fail(a_key, "a non-negative number");
				}
				a_out = static_cast<std::uint32_t>(std::min<std::int64_t>(value, std::numeric_limits<std::uint32_t>::max()));
				return true;
			}

			bool Strings(const char* a_key, std::vector<std::string>& a_out)
			{
				const auto* value = Find(a_key);
				if (!value) {
					return true;
				}
				if (!value->is_array()) {
					return Fail(a_key, "an array of strings");
				}
				std::vector<std::string> out;
				out.reserve(value->size());
				for (const auto& item : *value) {
					if (!item.is_string()) {
						return Fail(a_key, "an array of strings");
					}
					out.push_back(item.get<std::string>());
				}
				a_out = std::move(out);
				return true;
			}

			[[nodiscard]] const nlohmann::json* Find(const char* a_key) const
			{
				const auto it = _object.find(a_key);
				if (it == _object.end() || it->is_null()) {
					return nullptr;
				}
				return &*it;
			}

			bool Fail(const char* a_key, std::string_view a_expected)
			{
				if (_error.empty()) {
					_error = _path.empty() ? std::string(a_key) : _path + "." + a_key;
					_error += " must be ";
					_error += a_expected;
				}
				return false;
			}

		private:
			const nlohmann::json& _object;
			std::string _path;
			std::string _error;
		};

		OperationResult ParseLoreEntry(
			const nlohmann::json& a_entry,
			const std::string& a_path,
			LoreEntry& a_out,
			bool& a_outHasId)
		{
			if (!a_entry.is_object()) {
				return MakeFailure(Status::kInvalidProfile, a_path + " must be an object");
			}

			ObjectReader reader(a_entry, a_path);
			LoreEntry entry{};
			std::optional<std::string> logicText;
			std::optional<std::string> positionText;
			std::optional<bool> selective;
			bool selectiveFlag = false;

			const bool ok =
				reader.Strings("keys", entry.keys) &&
				reader.Strings("secondary_keys", entry.secondaryKeys) &&
				reader.Text("content", entry.content) &&
				reader.Flag("enabled", entry.enabled) &&
				reader.Integer("insertion_order", entry.insertionOrder) &&
				reader.Integer("priority", entry.priority) &&
				reader.Flag("case_sensitive", entry.caseSensitive) &&
				reader.Flag("use_regex", entry.useRegex) &&
				reader.Flag("constant", entry.constant) &&
				reader.Integer("probability", entry.probability) &&
				reader.Integer("depth", entry.depth) &&
				reader.Integer("scan_frequency", entry.scanFrequency) &&
				reader.Text("name", entry.name) &&
				reader.Text("comment", entry.comment) &&
				reader.Text("selective_logic", logicText) &&
				reader.Text("position", positionText) &&
				reader.Flag("selective", selectiveFlag) &&
				reader.Integer("id", entry.id);
			if (!ok) {
				return MakeFailure(Status::kInvalidProfile, reader.Error());
			}
			if (reader.Find("selective")) {
				selective = selectiveFlag;
			}

			if (positionText) {
				const auto position = ParseLorePosition(*positionText);
				if (!position) {
					return MakeFailure(Status::kInvalidProfile, a_path + ".position must be before_char or after_char");
				}
				entry.position = *position;
			}

			std::optional<SelectiveLogic> logic;
			if (logicText) {
				logic = ParseSelectiveLogic(*logicText);
				if (!logic) {
					return MakeFailure(Status::kInvalidProfile, a_path + ".selective_logic must be AND or NOT");
				}
			}

			if (selective.has_value() && !*selective) {
				entry.selectiveLogic = SelectiveLogic::kNone;
			} else if (logic.has_value() && *logic != SelectiveLogic::kNone) {
				entry.selectiveLogic = *logic;
			} else if (selective.value_or(false)) {
				entry.selectiveLogic = SelectiveLogic::kAnd;
			}

			a_outHasId = reader.Find("id") != nullptr;
			a_out = std::move(entry);
			return {};
		}

		OperationResult ParseLoreBookAt(const nlohmann::json& a_book, const std::string& a_path, LoreBook& a_out)
		{
			if (!a_book.is_object()) {
				return MakeFailure(Status::kInvalidProfile, a_path + " must be an object");
			}

			ObjectReader reader(a_book, a_path);
			LoreBook book{};
			const bool ok =
				reader.Text("name", book.name) &&
				reader.Count("scan_depth", book.scanDepth) &&
				reader.Count("token_budget", book.tokenBudget) &&
				reader.Flag("recursive_scanning", book.recursiveScanning);
			if (!ok) {
				return MakeFailure(Status::kInvalidProfile, reader.Error());
			}

			const auto* entries = reader.Find("entries");
			if (entries && !entries->is_array()) {
				return MakeFailure(Status::kInvalidProfile, a_path + ".entries must be an array");
			}

			std::vector<bool> hasId;
			if (entries) {
				book.entries.reserve(entries->size());
				for (std::size_t i = 0; i < entries->size(); ++i) {
					LoreEntry entry{};
					bool explicitId = false;
					const auto path = a_path + ".entries[" + std::to_string(i) + "]";
					if (auto result = ParseLoreEntry((*entries)[i], path, entry, explicitId); !result.Ok()) {
						return result;
					}
					book.entries.push_back(std::move(entry));
					hasId.push_back(explicitId);
				}
			}

			// Entries without an id continue after the largest explicit one, in book order.
			std::int64_t nextId = 0;
			for (std::size_t i = 0; i < book.entries.size(); ++i) {
				if (hasId[i] && book.entries[i].id >= nextId) {
					nextId = book.entries[i].id + 1;
				}
			}
			for (std::size_t i = 0; i < book.entries.size(); ++i) {
				if (!hasId[i]) {
					book.entries[i].id = nextId++;
				}
			}

			a_out = std::move(book);
			return {};
		}

		OperationResult ParseCardData(const nlohmann::json& a_data, const std::string& a_path, CardData& a_out)
		{
			ObjectReader reader(a_data, a_path);
			CardData data{};
			const bool ok =
				reader.Text("name", data.name) &&
				reader.Text("description", data.description) &&
				reader.Text("personality", data.personality) &&
				reader.Text("scenario", data.scenario) &&
				reader.Text("first_mes", data.firstMes) &&
				reader.Text("mes_example", data.mesExample) &&
				reader.Text("system_prompt", data.systemPrompt) &&
				reader.Text("post_history_instructions", data.postHistoryInstructions) &&
				reader.Text("creator_notes", data.creatorNotes) &&
				reader.Strings("alternate_greetings", data.alternateGreetings) &&
				reader.Strings("group_only_greetings", data.groupOnlyGreetings) &&
				reader.Strings("tags", data.tags) &&
				reader.Text("creator", data.creator) &&
				reader.Text("character_version", data.characterVersion);
			if (!ok) {
				return MakeFailure(Status::kInvalidProfile, reader.Error());
			}

			if (const auto* book = reader.Find("character_book")) {
				LoreBook parsed{};
				const auto path = a_path.empty() ? std::string("character_book") : a_path + ".character_book";
				if (auto result = ParseLoreBookAt(*book, path, parsed); !result.Ok()) {
					return result;
				}
				data.characterBook = std::move(parsed);
			}

			a_out = std::move(data);
			return {};
		}
	}

	OperationResult ParseLoreBook(const nlohmann::json& a_book, LoreBook& a_out)
	{
		return ParseLoreBookAt(a_book, "character_book", a_out);
	}

	OperationResult ParseCharacterProfile(const nlohmann::json& a_root, CharacterProfile& a_out)
	{
		if (!a_root.is_object()) {
			return MakeFailure(Status::kInvalidProfile, "profile document must be a JSON object");
		}

		const auto specIt = a_root.find("spec");
		const bool tagged = specIt != a_root.end() && !specIt->is_null();
		const auto dataIt = a_root.find("data");

		if (!tagged) {
			if (dataIt != a_root.end() && dataIt->is_object()) {
				return MakeFailure(Status::kInvalidProfile, "profile has a data object but no spec tag");
			}
			LegacyCard card{};
			if (auto result = ParseCardData(a_root, {}, card.data); !result.Ok()) {
				return result;
			}
			a_out = std::move(card);
			return {};
		}

		if (!specIt->is_string()) {
			return MakeFailure(Status::kInvalidProfile, "spec must be a string");
		}
		const auto spec = specIt->get<std::string>();
		if (!IsSupportedSpecTag(spec)) {
			return MakeFailure(Status::kInvalidProfile, "unsupported spec tag '" + spec + "'");
		}
		if (dataIt == a_root.end() || !dataIt->is_object()) {
			return MakeFailure(Status::kInvalidProfile, "data must be an object");
		}

		TaggedCard card{};
		card.spec = spec;
		card.specVersion = spec == kSpecTagV2 ? "2.0" : "3.0";

		ObjectReader reader(a_root, {});
		if (const auto* version = reader.Find("spec_version")) {
			if (version->is_string()) {
				card.specVersion = version->get<std::string>();
			} else if (version->is_number()) {
				card.specVersion = version->dump();
			} else {
				return MakeFailure(Status::kInvalidProfile, "spec_version must be a string");
			}
		}

		if (auto result = ParseCardData(*dataIt, "data", card.data); !result.Ok()) {
			return result;
		}
		a_out = std::move(card);
		return {};
	}

	OperationResult LoadCharacterProfile(const std::filesystem::path& a_path, CharacterProfile& a_out)
	{
		nlohmann::json root;
		const auto status = LoadJsonFile(a_path, "profile", root);
		if (status == LoadJsonStatus::kMissing) {
			spdlog::warn("LoreComposer: profile file {} does not exist", a_path.string());
		}
		if (status != LoadJsonStatus::kLoaded) {
			return MakeFailure(
				Status::kInvalidProfile,
				"could not load " + a_path.string() + " (" + std::string(LoadJsonStatusName(status)) + ")");
		}

		auto result = ParseCharacterProfile(root, a_out);
		if (!result.Ok()) {
			spdlog::warn("LoreComposer: rejected profile {} ({})", a_path.string(), result.message);
		}
		return result;
	}
}
