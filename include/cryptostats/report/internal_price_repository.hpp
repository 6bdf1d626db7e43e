#ifndef INTERNAL_PRICE_REPOSITORY_HPP
#define INTERNAL_PRICE_REPOSITORY_HPP

#include <map>
#include <shared_mutex>
#include <vector>

#include "cryptostats/report/i_price_repository.hpp"

namespace cryptostats::report {

// Key-ordered in-memory store: symbol, then timestamp. Reads return copies
// taken under a shared lock, so callers always see a consistent snapshot.
class InternalPriceRepository : public IPriceRepository {
public:
    void upsert(const std::vector<PriceObservation>& observations) override;

    std::vector<PriceObservation> find_by_symbol(const Symbol& symbol) const override;

    std::vector<PriceObservation> find_by_timestamp_range(Timestamp start, Timestamp end) const override;

    std::vector<PriceObservation> find_all() const override;

    std::size_t size() const override;

private:
    using Series = std::map<Timestamp, PriceObservation>;

    std::map<Symbol, Series> pricesBySymbol_;
    mutable std::shared_mutex mutex_;
};

}

#endif
