#include "LoreComposer/EngineSettings.h"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace LoreComposer
{
	namespace
	{
		void ParseLoggingSection(const nlohmann::json& a_logging, LoggingSettings& a_out)
		{
			a_out.debugLog = a_logging.value("debugLog", a_out.debugLog);
			a_out.file = a_logging.value("file", a_out.file);
		}

		void ParseActivationSection(const nlohmann::json& a_activation, ActivationOptions& a_out)
		{
			const auto depthIt = a_activation.find("scanDepth");
			if (depthIt != a_activation.end() && !depthIt->is_null()) {
				const double depth = depthIt->get<double>();
				a_out.scanDepth = static_cast<std::uint32_t>(std::clamp(depth, 0.0, static_cast<double>(kMaxScanDepth)));
			}

			const auto seedIt = a_activation.find("seed");
			if (seedIt != a_activation.end() && !seedIt->is_null()) {
				if (seedIt->is_number_integer()) {
					a_out.seed = seedIt->is_number_unsigned() ?
					                 seedIt->get<std::uint64_t>() :
					                 static_cast<std::uint64_t>(seedIt->get<std::int64_t>());
				} else {
					spdlog::warn("LoreComposer: settings activation.seed must be an integer; using {}.", a_out.seed);
				}
			}

			const auto& regex = a_activation.value("regex", nlohmann::json::object());
			if (regex.is_object()) {
				const double patternLength = regex.value("maxPatternLength", static_cast<double>(a_out.regex.maxPatternLength));
				const double windowBytes = regex.value("maxWindowBytes", static_cast<double>(a_out.regex.maxWindowBytes));
				a_out.regex.maxPatternLength = static_cast<std::size_t>(std::clamp(
					patternLength,
					static_cast<double>(kMinRegexPatternLength),
					static_cast<double>(kMaxRegexPatternLength)));
				a_out.regex.maxWindowBytes = static_cast<std::size_t>(std::clamp(
					windowBytes,
					static_cast<double>(kMinRegexWindowBytes),
					static_cast<double>(kMaxRegexWindowBytes)));
			}
		}

		void ParseBudgetSection(const nlohmann::json& a_budget, TokenBudget& a_out)
		{
			const double maxTokens = a_budget.value("maxTokens", static_cast<double>(a_out.maxTokens));
			a_out.maxTokens = maxTokens <= 0.0 ?
			                      0u :
			                      static_cast<std::uint32_t>(std::min(maxTokens, static_cast<double>(std::numeric_limits<std::uint32_t>::max())));

			const auto policyName = a_budget.value("dropPolicy", std::string(DropPolicyName(a_out.dropPolicy)));
			if (const auto policy = ParseDropPolicy(policyName)) {
				a_out.dropPolicy = *policy;
			} else {
				spdlog::warn(
					"LoreComposer: unknown drop policy '{}' in settings; using {}.",
					policyName,
					DropPolicyName(a_out.dropPolicy));
			}

			const auto preserveIt = a_budget.find("preserveFields");
			if (preserveIt != a_budget.end() && preserveIt->is_array()) {
				std::vector<std::string> fields;
				for (const auto& item : *preserveIt) {
					if (item.is_string()) {
						fields.push_back(item.get<std::string>());
					}
				}
				a_out.preserveFields = std::move(fields);
			}
		}

		template <class Section, class Parse>
		void ParseSection(const nlohmann::json& a_root, const char* a_key, Section& a_section, Parse a_parse)
		{
			const auto it = a_root.find(a_key);
			if (it == a_root.end() || it->is_null()) {
				return;
			}
			if (!it->is_object()) {
				spdlog::warn("LoreComposer: settings section '{}' is not an object; using defaults.", a_key);
				return;
			}

			Section parsed = a_section;
			try {
				a_parse(*it, parsed);
			} catch (const std::exception& e) {
				spdlog::warn("LoreComposer: invalid settings section '{}' ({}); using defaults.", a_key, e.what());
				return;
			}
			a_section = std::move(parsed);
		}
	}

	EngineSettings ParseEngineSettings(const nlohmann::json& a_root)
	{
		EngineSettings settings{};
		if (!a_root.is_object()) {
			spdlog::warn("LoreComposer: settings document is not a JSON object; using defaults.");
			return settings;
		}

		ParseSection(a_root, "logging", settings.logging, ParseLoggingSection);
		ParseSection(a_root, "activation", settings.activation, ParseActivationSection);
		ParseSection(a_root, "budget", settings.budget, ParseBudgetSection);

		const auto tokenizerIt = a_root.find("tokenizer");
		if (tokenizerIt != a_root.end() && tokenizerIt->is_string()) {
			settings.tokenizer = tokenizerIt->get<std::string>();
		}

		return settings;
	}

	LoadJsonStatus LoadEngineSettings(const std::filesystem::path& a_path, EngineSettings& a_out)
	{
		a_out = EngineSettings{};

		nlohmann::json root;
		const auto status = LoadJsonFile(a_path, "settings", root);
		if (status != LoadJsonStatus::kLoaded) {
			return status;
		}

		a_out = ParseEngineSettings(root);
		return status;
	}
}
