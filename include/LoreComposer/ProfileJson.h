#pragma once

#include "LoreComposer/CharacterProfile.h"
#include "LoreComposer/OperationResult.h"

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace LoreComposer
{
	// Accepts the flat v2 layout or a spec-tagged wrapper with a nested data object. Unknown
	// keys are ignored; wrongly typed known keys fail with kInvalidProfile.
	[[nodiscard]] OperationResult ParseCharacterProfile(const nlohmann::json& a_root, CharacterProfile& a_out);

	[[nodiscard]] OperationResult ParseLoreBook(const nlohmann::json& a_book, LoreBook& a_out);

	[[nodiscard]] OperationResult LoadCharacterProfile(const std::filesystem::path& a_path, CharacterProfile& a_out);
}
