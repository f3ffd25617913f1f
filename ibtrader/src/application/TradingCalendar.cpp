#include "application/TradingCalendar.hpp"
#include <boost/date_time/posix_time/conversion.hpp>
#include <boost/make_shared.hpp>
#include <cstdio>

namespace ibtrader::application {

namespace {

// "9:30 AM" / "09:30 AM"
std::string formatClock(int minutesOfDay, bool padHour) {
    int hour = minutesOfDay / 60;
    int minute = minutesOfDay % 60;
    const char* suffix = hour < 12 ? "AM" : "PM";
    int hour12 = hour % 12 == 0 ? 12 : hour % 12;

    char buf[16];
    std::snprintf(buf, sizeof(buf), padHour ? "%02d:%02d %s" : "%d:%02d %s",
                  hour12, minute, suffix);
    return buf;
}

} // namespace

TradingCalendar::TradingCalendar(const settings::TradingWindow& window)
    : window_(window)
    , zone_(boost::make_shared<boost::local_time::posix_time_zone>(window.timeZone))
{}

boost::local_time::local_date_time TradingCalendar::toLocal(const domain::Timestamp& at) const {
    auto utc = boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(at.value));
    return boost::local_time::local_date_time(utc, zone_);
}

MarketStatus TradingCalendar::status(const domain::Timestamp& at) const {
    auto local = toLocal(at).local_time();
    auto weekday = local.date().day_of_week().as_number();   // 0 = воскресенье

    if (weekday == 0 || weekday == 6) {
        return MarketStatus{false, "Market is closed (weekend)"};
    }

    auto tod = local.time_of_day();
    int minutes = static_cast<int>(tod.hours() * 60 + tod.minutes());
    std::string current = formatClock(minutes, true) + " ET";

    if (minutes < window_.openMinutes) {
        return MarketStatus{false, "Market is closed (opens at " +
                                   formatClock(window_.openMinutes, false) +
                                   " ET, currently " + current + ")"};
    }
    if (minutes >= window_.closeMinutes) {
        return MarketStatus{false, "Market is closed (closed at " +
                                   formatClock(window_.closeMinutes, false) +
                                   " ET, currently " + current + ")"};
    }
    return MarketStatus{true, "Market is open"};
}

std::string TradingCalendar::localDate(const domain::Timestamp& at) const {
    return boost::gregorian::to_iso_string(toLocal(at).local_time().date());
}

} // namespace ibtrader::application
