#ifndef CSV_PRICE_LOADER_HPP
#define CSV_PRICE_LOADER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "cryptostats/core/price_observation.hpp"
#include "cryptostats/report/i_price_repository.hpp"

namespace cryptostats::ingest {

using cryptostats::core::PriceObservation;
using cryptostats::report::IPriceRepository;

struct LoadSummary {
    std::size_t filesRead   = 0;
    std::size_t rowsLoaded  = 0;
    std::size_t rowsSkipped = 0;
};

// Reads "timestamp,symbol,price" files. The first line of every file is a
// header and is never parsed.
class CsvPriceLoader {
public:
    enum class LineResult {
        Parsed,
        Blank,
        Malformed
    };

    static LineResult parse_line(const std::string& line, PriceObservation& out);

    // empty when the file cannot be opened
    std::vector<PriceObservation> load_file(const std::string& path, LoadSummary& summary) const;

    LoadSummary load_into(IPriceRepository& repo,
                          const std::string& dataDir,
                          const std::vector<std::string>& fileNames) const;
};

}

#endif
