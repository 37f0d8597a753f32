#include "LoreComposer/JsonFile.h"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace LoreComposer
{
	LoadJsonStatus LoadJsonFile(
		const std::filesystem::path& a_path,
		std::string_view a_what,
		nlohmann::json& a_outRoot)
	{
		std::error_code ec;
		const bool exists = std::filesystem::exists(a_path, ec);
		if (ec) {
			spdlog::warn(
				"LoreComposer: failed to inspect {} file {} ({})",
				a_what,
				a_path.string(),
				ec.message());
			return LoadJsonStatus::kIoError;
		}
		if (!exists) {
			return LoadJsonStatus::kMissing;
		}

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("LoreComposer: failed to open {} file {}", a_what, a_path.string());
			return LoadJsonStatus::kIoError;
		}

		try {
			in >> a_outRoot;
		} catch (const std::exception& e) {
			spdlog::warn("LoreComposer: failed to parse {} file {} ({})", a_what, a_path.string(), e.what());
			return LoadJsonStatus::kParseError;
		}

		if (!in.good() && !in.eof()) {
			spdlog::warn("LoreComposer: failed while reading {} file {}", a_what, a_path.string());
			return LoadJsonStatus::kIoError;
		}

		return LoadJsonStatus::kLoaded;
	}
}
