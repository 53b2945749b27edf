#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>
#include <string>
#include <stdexcept>

namespace loans::domain {

/**
 * @brief Календарная дата (без времени)
 */
using CalendarDate = boost::gregorian::date;

/**
 * @brief Разобрать дату ISO 8601 (YYYY-MM-DD)
 * @throws std::invalid_argument для некорректной строки
 */
inline CalendarDate parseDate(const std::string& str) {
    CalendarDate date;
    try {
        date = boost::gregorian::from_simple_string(str);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid date: " + str);
    }
    if (date.is_special()) {
        throw std::invalid_argument("Invalid date: " + str);
    }
    return date;
}

inline std::string toIsoString(const CalendarDate& date) {
    return boost::gregorian::to_iso_extended_string(date);
}

/**
 * @brief Сдвинуть дату на N календарных месяцев
 *
 * День месяца сохраняется, если его нет в целевом месяце — берётся последний
 * день (31 янв + 1 мес = 28/29 фев). Считается всегда от исходной даты,
 * поэтому короткий месяц не "съедает" день у следующих платежей.
 */
inline CalendarDate addMonths(const CalendarDate& start, int months) {
    int totalMonths = static_cast<int>(start.year()) * 12 + (static_cast<int>(start.month()) - 1) + months;
    int year = totalMonths / 12;
    int month = totalMonths % 12 + 1;

    int lastDay = boost::gregorian::gregorian_calendar::end_of_month_day(
        static_cast<unsigned short>(year), static_cast<unsigned short>(month));
    int day = start.day();
    if (day > lastDay) {
        day = lastDay;
    }

    return CalendarDate(static_cast<unsigned short>(year),
                        static_cast<unsigned short>(month),
                        static_cast<unsigned short>(day));
}

inline CalendarDate addDays(const CalendarDate& start, int days) {
    return start + boost::gregorian::days(days);
}

} // namespace loans::domain
