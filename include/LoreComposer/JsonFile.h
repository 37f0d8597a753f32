#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace LoreComposer
{
	enum class LoadJsonStatus : std::uint8_t
	{
		kLoaded = 0,
		kMissing,
		kIoError,
		kParseError,
	};

	[[nodiscard]] constexpr std::string_view LoadJsonStatusName(LoadJsonStatus a_status) noexcept
	{
		switch (a_status) {
		case LoadJsonStatus::kLoaded:
			return "loaded";
		case LoadJsonStatus::kMissing:
			return "missing";
		case LoadJsonStatus::kIoError:
			return "io-error";
		case LoadJsonStatus::kParseError:
			return "parse-error";
		}
		return "unknown";
	}

	// Reads and parses a JSON document. Failures other than kMissing are logged with a_what
	// naming the kind of file.
	[[nodiscard]] LoadJsonStatus LoadJsonFile(
		const std::filesystem::path& a_path,
		std::string_view a_what,
		nlohmann::json& a_outRoot);
}
