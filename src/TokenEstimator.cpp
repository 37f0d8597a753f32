#include "LoreComposer/TokenEstimator.h"

#include "LoreComposer/TextUtil.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace LoreComposer
{
	namespace
	{
		std::uint32_t ClampTokenCount(double a_value) noexcept
		{
			if (!(a_value > 0.0)) {
				return 0u;
			}
			constexpr double kMax = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
			return static_cast<std::uint32_t>(std::min(std::ceil(a_value), kMax));
		}
	}

	std::uint32_t Gpt2BpeApproxEstimator::Estimate(std::string_view a_text) const
	{
		if (a_text.empty()) {
			return 0u;
		}

		const auto chars = static_cast<double>(TextUtil::CountUtf8CodePoints(a_text));
		const auto words = static_cast<double>(TextUtil::CountWhitespaceSeparatedWords(a_text));
		return ClampTokenCount(chars / 4.0 + words * 0.3);
	}

	std::uint32_t LlamaSpApproxEstimator::Estimate(std::string_view a_text) const
	{
		if (a_text.empty()) {
			return 0u;
		}

		const auto chars = static_cast<double>(TextUtil::CountUtf8CodePoints(a_text));
		return ClampTokenCount(chars / 4.5);
	}

	FunctionTokenEstimator::FunctionTokenEstimator(std::string a_id, EstimateFn a_estimate) :
		_id(std::move(a_id)),
		_estimate(std::move(a_estimate))
	{}

	std::uint32_t FunctionTokenEstimator::Estimate(std::string_view a_text) const
	{
		return _estimate ? _estimate(a_text) : 0u;
	}

	TokenizerRegistry::TokenizerRegistry()
	{
		Register(std::make_unique<Gpt2BpeApproxEstimator>());
		Register(std::make_unique<LlamaSpApproxEstimator>());
	}

	void TokenizerRegistry::Register(std::unique_ptr<TokenEstimator> a_estimator)
	{
		if (!a_estimator) {
			return;
		}

		const auto id = a_estimator->Id();
		const auto it = std::find_if(_estimators.begin(), _estimators.end(), [&](const auto& a_existing) {
			return a_existing->Id() == id;
		});
		if (it != _estimators.end()) {
			*it = std::move(a_estimator);
			return;
		}
		_estimators.push_back(std::move(a_estimator));
	}

	const TokenEstimator* TokenizerRegistry::Find(std::string_view a_id) const noexcept
	{
		for (const auto& estimator : _estimators) {
			if (estimator->Id() == a_id) {
				return estimator.get();
			}
		}
		return nullptr;
	}

	std::vector<std::string_view> TokenizerRegistry::Ids() const
	{
		std::vector<std::string_view> out;
		out.reserve(_estimators.size());
		for (const auto& estimator : _estimators) {
			out.push_back(estimator->Id());
		}
		return out;
	}
}
