#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace LoreComposer
{
	// Structural input errors. Budget shortfalls are not errors (see Composition::overBudget),
	// and estimator exceptions propagate to the caller untouched.
	enum class Status : std::uint8_t
	{
		kOk = 0,
		kInvalidProfile,
		kUnknownVariant,
		kUnknownField,
	};

	struct OperationResult
	{
		Status status{ Status::kOk };
		std::string message{};

		[[nodiscard]] bool Ok() const noexcept
		{
			return status == Status::kOk;
		}
	};

	[[nodiscard]] constexpr std::string_view StatusName(Status a_status) noexcept
	{
		switch (a_status) {
		case Status::kOk:
			return "Ok";
		case Status::kInvalidProfile:
			return "InvalidProfile";
		case Status::kUnknownVariant:
			return "UnknownVariant";
		case Status::kUnknownField:
			return "UnknownField";
		}
		return "Unknown";
	}

	[[nodiscard]] inline OperationResult MakeFailure(Status a_status, std::string a_message)
	{
		return OperationResult{
			.status = a_status,
			.message = std::move(a_message)
		};
	}
}
