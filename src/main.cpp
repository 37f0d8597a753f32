#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "LoreComposer/EngineSettings.h"
#include "LoreComposer/FieldExtractor.h"
#include "LoreComposer/LoreActivation.h"
#include "LoreComposer/ProfileJson.h"
#include "LoreComposer/ProfileValidation.h"
#include "LoreComposer/PromptCompositor.h"
#include "LoreComposer/PromptVariants.h"
#include "LoreComposer/ResultJson.h"
#include "LoreComposer/TextUtil.h"
#include "LoreComposer/TokenEstimator.h"

namespace
{
	constexpr int kExitOk = 0;
	constexpr int kExitFailure = 1;
	constexpr int kExitUsage = 2;

	constexpr std::string_view kUsage =
		"usage: lorecomposer [--config FILE] [--debug] <command> [args]\n"
		"\n"
		"commands:\n"
		"  variants                      list prompt variants\n"
		"  compose  CARD [options]       compose a prompt (--variant, budget and activation options)\n"
		"  compare  CARD [options]       compose under several variants (--variant may repeat)\n"
		"  test     CARD [options]       run lore activation against --input and --history\n"
		"  stats    CARD                 summarize the embedded lorebook\n"
		"  preview  CARD --field F --value V [options]\n"
		"                                compare the prompt before and after changing a field\n"
		"  validate CARD                 lint the card and its lorebook\n"
		"\n"
		"options:\n"
		"  --variant NAME  --max-tokens N  --drop-policy P  --preserve a,b\n"
		"  --input TEXT  --history TEXT (repeatable)  --seed N  --scan-depth N  --tokenizer ID\n";

	struct CommandLine
	{
		std::optional<std::string> configPath{};
		bool debug{ false };
		std::string command{};
		std::vector<std::string> positional{};
		std::map<std::string, std::vector<std::string>, std::less<>> options{};

		[[nodiscard]] const std::string* Last(std::string_view a_name) const
		{
			const auto it = options.find(a_name);
			if (it == options.end() || it->second.empty()) {
				return nullptr;
			}
			return &it->second.back();
		}

		[[nodiscard]] std::vector<std::string> All(std::string_view a_name) const
		{
			const auto it = options.find(a_name);
			return it == options.end() ? std::vector<std::string>{} : it->second;
		}
	};

	class UsageError : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};

	void SetupLogging(const LoreComposer::LoggingSettings& a_settings)
	{
		spdlog::sink_ptr sink;
		if (!a_settings.file.empty()) {
			try {
				sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(a_settings.file, true);
			} catch (const spdlog::spdlog_ex& e) {
				std::cerr << "lorecomposer: cannot open log file " << a_settings.file << " (" << e.what() << ")\n";
			}
		}
		if (!sink) {
			sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
		}

		auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
		spdlog::set_level(a_settings.debugLog ? spdlog::level::debug : spdlog::level::info);
		spdlog::flush_on(spdlog::level::info);
	}

	template <class T>
	T ParseNumber(std::string_view a_option, const std::string& a_text)
	{
		T value{};
		const auto* begin = a_text.data();
		const auto* end = a_text.data() + a_text.size();
		const auto result = std::from_chars(begin, end, value);
		if (result.ec != std::errc{} || result.ptr != end) {
			throw UsageError("--" + std::string(a_option) + " expects a non-negative integer, got '" + a_text + "'");
		}
		return value;
	}

	CommandLine ParseCommandLine(int a_argc, char** a_argv)
	{
		CommandLine out{};
		int i = 1;
		for (; i < a_argc; ++i) {
			const std::string_view arg = a_argv[i];
			if (arg == "--config") {
				if (i + 1 >= a_argc) {
					throw UsageError("--config expects a file");
				}
				out.configPath = a_argv[++i];
			} else if (arg == "--debug") {
				out.debug = true;
			} else if (arg.starts_with("--")) {
				throw UsageError("unknown global option " + std::string(arg));
			} else {
				break;
			}
		}
		if (i >= a_argc) {
			throw UsageError("missing command");
		}
		out.command = a_argv[i++];

		for (; i < a_argc; ++i) {
			const std::string_view arg = a_argv[i];
			if (!arg.starts_with("--")) {
				out.positional.emplace_back(arg);
				continue;
			}
			if (i + 1 >= a_argc) {
				throw UsageError(std::string(arg) + " expects a value");
			}
			out.options[std::string(arg.substr(2))].emplace_back(a_argv[++i]);
		}
		return out;
	}

	std::vector<std::string> SplitList(std::string_view a_text)
	{
		std::vector<std::string> out;
		while (!a_text.empty()) {
			const auto comma = a_text.find(',');
			const auto part = LoreComposer::TextUtil::Trim(a_text.substr(0, comma));
			if (!part.empty()) {
				out.emplace_back(part);
			}
			if (comma == std::string_view::npos) {
				break;
			}
			a_text.remove_prefix(comma + 1);
		}
		return out;
	}

	std::optional<LoreComposer::TokenBudget> ResolveBudget(
		const CommandLine& a_cli,
		const LoreComposer::EngineSettings& a_settings)
	{
		auto budget = a_settings.budget;
		if (const auto* maxTokens = a_cli.Last("max-tokens")) {
			budget.maxTokens = ParseNumber<std::uint32_t>("max-tokens", *maxTokens);
		}
		if (const auto* policy = a_cli.Last("drop-policy")) {
			const auto parsed = LoreComposer::ParseDropPolicy(*policy);
			if (!parsed) {
				throw UsageError("unknown drop policy '" + *policy + "'");
			}
			budget.dropPolicy = *parsed;
		}
		if (const auto* preserve = a_cli.Last("preserve")) {
			budget.preserveFields = SplitList(*preserve);
		}
		if (budget.maxTokens == 0) {
			return std::nullopt;
		}
		return budget;
	}

	LoreComposer::ComposeOptions ResolveComposeOptions(
		const CommandLine& a_cli,
		const LoreComposer::EngineSettings& a_settings)
	{
		LoreComposer::ComposeOptions options{};
		options.activation = a_settings.activation;
		if (const auto* input = a_cli.Last("input")) {
			options.input = *input;
		}
		options.history = a_cli.All("history");
		if (const auto* seed = a_cli.Last("seed")) {
			options.activation.seed = ParseNumber<std::uint64_t>("seed", *seed);
		}
		if (const auto* depth = a_cli.Last("scan-depth")) {
			options.activation.scanDepth = ParseNumber<std::uint32_t>("scan-depth", *depth);
		}
		return options;
	}

	const LoreComposer::TokenEstimator& ResolveEstimator(
		const LoreComposer::TokenizerRegistry& a_registry,
		const CommandLine& a_cli,
		const LoreComposer::EngineSettings& a_settings)
	{
		std::string id = a_settings.tokenizer;
		if (const auto* requested = a_cli.Last("tokenizer")) {
			id = *requested;
		}
		if (const auto* estimator = a_registry.Find(id)) {
			return *estimator;
		}
		spdlog::warn("LoreComposer: unknown tokenizer '{}'; using {}.", id, LoreComposer::kDefaultTokenizerId);
		return *a_registry.Find(LoreComposer::kDefaultTokenizerId);
	}

	const std::string& RequireCardPath(const CommandLine& a_cli)
	{
		if (a_cli.positional.empty()) {
			throw UsageError(a_cli.command + " expects a card file");
		}
		return a_cli.positional.front();
	}

	std::string ResolveVariantName(const CommandLine& a_cli)
	{
		const auto* variant = a_cli.Last("variant");
		return variant ? *variant : std::string(LoreComposer::Variants::kGenericV3Name);
	}

	int Emit(const nlohmann::json& a_out, int a_exitCode = kExitOk)
	{
		std::cout << a_out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
		return a_exitCode;
	}

	int EmitFailure(const LoreComposer::OperationResult& a_result)
	{
		spdlog::error("LoreComposer: {} ({})", a_result.message, LoreComposer::StatusName(a_result.status));
		return Emit(nlohmann::json{ { "error", LoreComposer::ToJson(a_result) } }, kExitFailure);
	}

	int RunCommand(const CommandLine& a_cli, const LoreComposer::EngineSettings& a_settings)
	{
		using namespace LoreComposer;

		constexpr std::string_view kCommands[] = { "variants", "compose", "compare", "test", "stats", "preview", "validate" };
		if (std::find(std::begin(kCommands), std::end(kCommands), a_cli.command) == std::end(kCommands)) {
			throw UsageError("unknown command '" + a_cli.command + "'");
		}

		if (a_cli.command == "variants") {
			return Emit(ToJson(ListVariants()));
		}

		const auto& cardPath = RequireCardPath(a_cli);
		CharacterProfile profile;
		if (auto result = LoadCharacterProfile(cardPath, profile); !result.Ok()) {
			return EmitFailure(result);
		}

		const TokenizerRegistry registry;
		const auto& estimator = ResolveEstimator(registry, a_cli, a_settings);

		if (a_cli.command == "compose") {
			Composition composition;
			const auto result = ComposePrompt(
				profile,
				ResolveVariantName(a_cli),
				ResolveBudget(a_cli, a_settings),
				ResolveComposeOptions(a_cli, a_settings),
				estimator,
				composition);
			return result.Ok() ? Emit(ToJson(composition)) : EmitFailure(result);
		}

		if (a_cli.command == "compare") {
			VariantComparison comparison;
			const auto result = CompareVariants(
				profile,
				a_cli.All("variant"),
				ResolveBudget(a_cli, a_settings),
				ResolveComposeOptions(a_cli, a_settings),
				estimator,
				comparison);
			return result.Ok() ? Emit(ToJson(comparison)) : EmitFailure(result);
		}

		if (a_cli.command == "test") {
			const auto options = ResolveComposeOptions(a_cli, a_settings);
			const auto* input = a_cli.Last("input");
			const auto result = TestInput(
				input ? std::string_view(*input) : std::string_view{},
				GetLoreBook(profile),
				options.history,
				options.activation,
				estimator);
			return Emit(ToJson(result));
		}

		if (a_cli.command == "stats") {
			return Emit(ToJson(GetEntryStats(GetLoreBook(profile))));
		}

		if (a_cli.command == "preview") {
			const auto* field = a_cli.Last("field");
			const auto* value = a_cli.Last("value");
			if (!field || !value) {
				throw UsageError("preview expects --field and --value");
			}
			FieldChangePreview preview;
			const auto result = PreviewFieldChange(
				profile,
				*field,
				*value,
				ResolveVariantName(a_cli),
				ResolveBudget(a_cli, a_settings),
				ResolveComposeOptions(a_cli, a_settings),
				estimator,
				preview);
			return result.Ok() ? Emit(ToJson(preview)) : EmitFailure(result);
		}

		// validate
		const auto report = ValidateProfile(profile, a_settings.activation.regex);
		return Emit(ToJson(report), report.valid ? kExitOk : kExitFailure);
	}
}

int main(int a_argc, char** a_argv)
{
	SetupLogging(LoreComposer::LoggingSettings{});

	try {
		const auto cli = ParseCommandLine(a_argc, a_argv);

		LoreComposer::EngineSettings settings{};
		if (cli.configPath) {
			const auto status = LoreComposer::LoadEngineSettings(*cli.configPath, settings);
			if (status == LoreComposer::LoadJsonStatus::kMissing) {
				spdlog::warn("LoreComposer: settings file {} not found; using defaults.", *cli.configPath);
			}
		}
		if (cli.debug) {
			settings.logging.debugLog = true;
		}
		SetupLogging(settings.logging);
		spdlog::debug("LoreComposer: running '{}' with tokenizer {}.", cli.command, settings.tokenizer);

		return RunCommand(cli, settings);
	} catch (const UsageError& e) {
		std::cerr << "lorecomposer: " << e.what() << "\n\n" << kUsage;
		return kExitUsage;
	} catch (const std::exception& e) {
		spdlog::critical("LoreComposer: {}", e.what());
		return kExitFailure;
	}
}
