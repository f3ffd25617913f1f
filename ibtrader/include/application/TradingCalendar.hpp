#pragma once

#include "domain/Timestamp.hpp"
#include "settings/EngineConfig.hpp"
#include <boost/date_time/local_time/local_time.hpp>
#include <string>

namespace ibtrader::application {

/**
 * @brief Статус рынка на момент проверки
 */
struct MarketStatus {
    bool open = false;
    std::string message;
};

/**
 * @brief Торговое окно: 09:30-16:00 по Нью-Йорку, понедельник-пятница
 *
 * Переход на летнее время учитывается через posix_time_zone.
 * Праздники не учитываются.
 */
class TradingCalendar {
public:
    explicit TradingCalendar(const settings::TradingWindow& window = settings::TradingWindow{});

    MarketStatus status(const domain::Timestamp& at) const;

    bool isOpen(const domain::Timestamp& at) const {
        return status(at).open;
    }

    /**
     * @brief Дата биржи в формате YYYYMMDD
     */
    std::string localDate(const domain::Timestamp& at) const;

private:
    settings::TradingWindow window_;
    boost::local_time::time_zone_ptr zone_;

    boost::local_time::local_date_time toLocal(const domain::Timestamp& at) const;
};

} // namespace ibtrader::application
