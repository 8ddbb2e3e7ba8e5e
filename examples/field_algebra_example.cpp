#include <iostream>
#include <string>

#include <calgebra/calgebra.hpp>

using namespace calgebra;

namespace {

constexpr int64_t millis_per_hour = 60LL * 60 * 1000;
constexpr int64_t millis_per_day = 24 * millis_per_hour;

// Helper function to print one field's view of an instant
void printField(const DateTimeField& field, int64_t instant) {
    std::cout << "  " << field.name() << ": ";
    auto value = field.get(instant);
    if (value) {
        std::cout << *value << "\n";
    } else {
        std::cout << value.error().describe() << "\n";
    }
}

void printResult(const std::string& label, const FieldResult<int64_t>& result) {
    std::cout << "  " << label << ": ";
    if (result) {
        std::cout << *result << " ms\n";
    } else {
        std::cout << "error: " << result.error().describe() << "\n";
    }
}

} // namespace

int main() {
    std::cout << "CALGEBRA Field Algebra Examples\n";
    std::cout << "===============================\n\n";

    // Example 1: Building fields from primitives and decorators
    std::cout << "1. Composing Time-of-Day Fields\n";
    std::cout << "-------------------------------\n";

    auto hours = PreciseDurationField::create(DurationKind::hours, millis_per_hour);
    auto days = PreciseDurationField::create(DurationKind::days, millis_per_day);
    if (!hours || !days) {
        std::cerr << "Failed to create duration fields\n";
        return 1;
    }

    auto hour_of_day = PreciseDateTimeField::create(FieldKind::hour_of_day, *hours, *days);
    if (!hour_of_day) {
        std::cerr << "Failed to create hourOfDay: " << hour_of_day.error().describe() << "\n";
        return 1;
    }

    auto halfday = DividedDateTimeField::create(*hour_of_day, FieldKind::halfday_of_day, 12);
    auto hour_of_halfday =
        RemainderDateTimeField::create(*hour_of_day, FieldKind::hour_of_halfday, 12);
    auto clockhour = ZeroIsMaxDateTimeField::create(*hour_of_day, FieldKind::clockhour_of_day);
    if (!halfday || !hour_of_halfday || !clockhour) {
        std::cerr << "Failed to compose derived fields\n";
        return 1;
    }

    int64_t afternoon = 13 * millis_per_hour + 30 * 60 * 1000;
    std::cout << "Instant " << afternoon << " ms (13:30 on the epoch day):\n";
    printField(**hour_of_day, afternoon);
    printField(**halfday, afternoon);
    printField(**hour_of_halfday, afternoon);
    printField(**clockhour, afternoon);

    std::cout << "Midnight:\n";
    printField(**hour_of_day, 0);
    printField(**clockhour, 0);
    std::cout << std::endl;

    // Example 2: Setting, wrapping and rounding
    std::cout << "2. Arithmetic and Rounding\n";
    std::cout << "--------------------------\n";

    printResult("set hourOfHalfday to 11", (*hour_of_halfday)->set(afternoon, 11));
    printResult("add 14 hours", (*hour_of_day)->add(afternoon, 14));
    printResult("add 14 hours wrapping in the day", (*hour_of_day)->add_wrap_field(afternoon, 14));
    printResult("round to halfday", (*halfday)->round_floor(afternoon));
    printResult("round half-even to hour", (*hour_of_day)->round_half_even(afternoon));
    std::cout << std::endl;

    // Example 3: Errors are values
    std::cout << "3. Validation Errors\n";
    std::cout << "--------------------\n";

    printResult("set clockhourOfDay to 0", (*clockhour)->set(afternoon, 0));
    printResult("set hourOfDay to 24", (*hour_of_day)->set(afternoon, 24));

    auto weeks = UnsupportedDurationField::instance(DurationKind::weeks);
    auto week_field = UnsupportedDateTimeField::instance(FieldKind::week_of_weekyear, weeks);
    if (week_field) {
        printResult("add to unsupported weekOfWeekyear", (*week_field)->add(afternoon, 1));
    }

    return 0;
}
