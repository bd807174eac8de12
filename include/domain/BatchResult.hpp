#pragma once

#include "Quote.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace pricefetcher::domain {

/**
 * @brief Неудача по одному тикеру внутри пакетного запроса
 */
struct SymbolFailure {
    std::string symbol;
    std::string message;

    bool operator==(const SymbolFailure& other) const {
        return symbol == other.symbol && message == other.message;
    }
};

/**
 * @brief Результат пакетного запроса
 *
 * Успехи и ошибки хранятся раздельно, каждая группа в порядке входного списка.
 * Живёт ровно один цикл запрос/ответ.
 */
struct BatchResult {
    std::vector<Quote> quotes;
    std::vector<SymbolFailure> failures;

    bool allFailed() const {
        return quotes.empty() && !failures.empty();
    }
};

/**
 * @brief Ни один тикер пакета не удалось получить
 *
 * Не является FetchError: рендерится как ошибка всего пакета.
 */
class AllPricesFailedError : public std::runtime_error {
public:
    explicit AllPricesFailedError(std::vector<SymbolFailure> failures)
        : std::runtime_error("Failed to fetch any prices. Errors: " + join(failures))
        , failures_(std::move(failures))
    {}

    const std::vector<SymbolFailure>& failures() const { return failures_; }

private:
    std::vector<SymbolFailure> failures_;

    static std::string join(const std::vector<SymbolFailure>& failures) {
        std::string result;
        for (size_t i = 0; i < failures.size(); ++i) {
            if (i > 0) result += ", ";
            result += failures[i].symbol + ": " + failures[i].message;
        }
        return result;
    }
};

} // namespace pricefetcher::domain
