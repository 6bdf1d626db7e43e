#include "cryptostats/ingest/csv_price_loader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "cryptostats/core/decimal.hpp"

namespace cryptostats::ingest {

namespace {

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool parse_millis(const std::string& text, EpochMillis& out)
{
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) return false;
    out = static_cast<EpochMillis>(value);
    return true;
}

std::string join_path(const std::string& dir, const std::string& name)
{
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

}

CsvPriceLoader::LineResult CsvPriceLoader::parse_line(const std::string& line, PriceObservation& out)
{
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }

    if (fields.empty() || fields[0].empty()) return LineResult::Blank;
    if (fields.size() != 3) return LineResult::Malformed;

    EpochMillis millis = 0;
    if (!parse_millis(fields[0], millis)) return LineResult::Malformed;
    if (fields[1].empty()) return LineResult::Malformed;

    Price price;
    if (!core::try_parse_decimal(fields[2], price) || price < 0) return LineResult::Malformed;

    out = PriceObservation(fields[1], util::Timestamp::from_millis(millis), std::move(price));
    return LineResult::Parsed;
}

std::vector<PriceObservation> CsvPriceLoader::load_file(const std::string& path, LoadSummary& summary) const
{
    std::vector<PriceObservation> result;

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("failed to open price file: {}", path);
        return result;
    }

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (lineNo == 1) continue;

        PriceObservation obs;
        switch (parse_line(line, obs)) {
        case LineResult::Parsed:
            result.push_back(std::move(obs));
            break;
        case LineResult::Blank:
            break;
        case LineResult::Malformed:
            spdlog::warn("{}:{} skipped malformed row '{}'", path, lineNo, line);
            ++summary.rowsSkipped;
            break;
        }
    }

    ++summary.filesRead;
    summary.rowsLoaded += result.size();
    spdlog::info("read {} rows from {}", result.size(), path);
    return result;
}

LoadSummary CsvPriceLoader::load_into(IPriceRepository& repo,
                                      const std::string& dataDir,
                                      const std::vector<std::string>& fileNames) const
{
    LoadSummary summary;
    for (const auto& name : fileNames) {
        auto observations = load_file(join_path(dataDir, name), summary);
        if (!observations.empty()) {
            repo.upsert(observations);
        }
    }

    spdlog::info("loaded {} rows from {} files ({} skipped)",
                 summary.rowsLoaded, summary.filesRead, summary.rowsSkipped);
    return summary;
}

}
