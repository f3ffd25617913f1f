#pragma once

#include "domain/Timestamp.hpp"

namespace ibtrader::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Нужен, чтобы проверку торгового окна можно было тестировать
 * без привязки к реальному времени.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;
};

/**
 * @brief Системные часы
 */
class SystemClock : public IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace ibtrader::ports::output
