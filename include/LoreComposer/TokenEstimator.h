#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	inline constexpr std::string_view kGpt2BpeApproxId = "gpt2-bpe-approx";
	inline constexpr std::string_view kLlamaSpApproxId = "llama-sp-approx";
	inline constexpr std::string_view kDefaultTokenizerId = kGpt2BpeApproxId;

	// Text -> token count estimate. Implementations must be deterministic and safe to call
	// concurrently through a const reference; any caching is the implementation's business.
	// Exceptions thrown by Estimate() propagate through the engine unchanged.
	class TokenEstimator
	{
	public:
		virtual ~TokenEstimator() = default;

		[[nodiscard]] virtual std::string_view Id() const noexcept = 0;
		[[nodiscard]] virtual std::uint32_t Estimate(std::string_view a_text) const = 0;
	};

	// GPT-2 style approximation: ~4 characters per token plus a per-word surcharge.
	class Gpt2BpeApproxEstimator final : public TokenEstimator
	{
	public:
		[[nodiscard]] std::string_view Id() const noexcept override { return kGpt2BpeApproxId; }
		[[nodiscard]] std::uint32_t Estimate(std::string_view a_text) const override;
	};

	// SentencePiece style approximation: ~4.5 characters per token.
	class LlamaSpApproxEstimator final : public TokenEstimator
	{
	public:
		[[nodiscard]] std::string_view Id() const noexcept override { return kLlamaSpApproxId; }
		[[nodiscard]] std::uint32_t Estimate(std::string_view a_text) const override;
	};

	// Adapts a callable, e.g. a caller-owned real tokenizer.
	class FunctionTokenEstimator final : public TokenEstimator
	{
	public:
		using EstimateFn = std::function<std::uint32_t(std::string_view)>;

		FunctionTokenEstimator(std::string a_id, EstimateFn a_estimate);

		[[nodiscard]] std::string_view Id() const noexcept override { return _id; }
		[[nodiscard]] std::uint32_t Estimate(std::string_view a_text) const override;

	private:
		std::string _id;
		EstimateFn _estimate;
	};

	class TokenizerRegistry
	{
	public:
		// Registers the built-in approximations.
		TokenizerRegistry();

		// Replaces any estimator with the same id.
		void Register(std::unique_ptr<TokenEstimator> a_estimator);

		[[nodiscard]] const TokenEstimator* Find(std::string_view a_id) const noexcept;
		[[nodiscard]] std::vector<std::string_view> Ids() const;

	private:
		std::vector<std::unique_ptr<TokenEstimator>> _estimators;
	};
}
