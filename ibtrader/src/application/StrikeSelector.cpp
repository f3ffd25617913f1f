#include "application/StrikeSelector.hpp"
#include "domain/EngineError.hpp"
#include <algorithm>

namespace ibtrader::application {

using domain::Decimal;

std::string StrikeSelector::nearestExpiry(const std::vector<std::string>& expirations,
                                          const std::string& today) const {
    if (expirations.empty()) {
        throw domain::EngineException(domain::ErrorCode::NO_OPTIONS_AVAILABLE,
                                      "No expirations found");
    }

    std::vector<std::string> sorted(expirations);
    std::sort(sorted.begin(), sorted.end());

    // YYYYMMDD сравнивается как строка
    auto it = std::lower_bound(sorted.begin(), sorted.end(), today);
    return it != sorted.end() ? *it : sorted.front();
}

std::vector<Decimal> StrikeSelector::selectStrikes(const std::vector<Decimal>& strikes,
                                                   const Decimal& price) const {
    std::vector<Decimal> sorted(strikes);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    if (sorted.empty() || ladderSize_ <= 0) {
        return {};
    }

    size_t closest = 0;
    for (size_t i = 1; i < sorted.size(); ++i) {
        if ((sorted[i] - price).abs() < (sorted[closest] - price).abs()) {
            closest = i;
        }
    }

    const size_t n = sorted.size();
    const size_t size = static_cast<size_t>(ladderSize_);
    const size_t half = size / 2;

    size_t start = closest > half ? closest - half : 0;
    size_t end = std::min(n, closest + half);

    if (end - start < size) {
        if (start == 0) {
            end = std::min(n, size);
        } else if (end == n) {
            start = n > size ? n - size : 0;
        }
    }

    std::vector<Decimal> selected(sorted.begin() + start, sorted.begin() + end);
    std::reverse(selected.begin(), selected.end());
    return selected;
}

domain::StrikeLadder StrikeSelector::buildLadder(const domain::OptionChainParams& chain,
                                                 const Decimal& price,
                                                 const std::string& today) const {
    domain::StrikeLadder ladder;
    ladder.symbol = chain.symbol;
    ladder.underlyingPrice = price;
    ladder.expiry = nearestExpiry(chain.expirations, today);
    ladder.strikes = selectStrikes(chain.strikes, price);

    if (ladder.strikes.empty()) {
        throw domain::EngineException(domain::ErrorCode::NO_OPTIONS_AVAILABLE,
                                      "No strikes found for " + chain.symbol);
    }
    return ladder;
}

} // namespace ibtrader::application
