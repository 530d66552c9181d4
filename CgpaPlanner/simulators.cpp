#include "services.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

/*
-------------------------------------------------------------------------------
 simulators.cpp — What-if edits on a Distribution
-------------------------------------------------------------------------------
Both simulators copy the input once and edit the copy. If any step fails the
copy is thrown away with the exception; the caller's distribution was never
writable from here.
-------------------------------------------------------------------------------
*/

namespace {

std::string describe(const Conversion& op) {
    std::ostringstream os;
    os << op.credits << " credits " << grade_symbol(op.from) << " -> " << grade_symbol(op.to);
    return os.str();
}

double credits_at(const Distribution& dist, Grade g) {
    auto it = dist.find(g);
    return it == dist.end() ? 0.0 : it->second;
}

} // namespace

Distribution simulate_improvement(const Distribution& dist, const std::vector<Conversion>& ops) {
    const GradeScale& scale = GradeScale::standard();
    Distribution next = dist;

    for (std::size_t i = 0; i < ops.size(); ++i) {
        const Conversion& op = ops[i];
        const std::string where = "Conversion " + std::to_string(i + 1) + " (" + describe(op) + "): ";

        if (!scale.is_gradeable(op.from) || !scale.is_gradeable(op.to))
            throw InvalidConversionError(i, where + "grade P has no point value and cannot be converted");
        if (!std::isfinite(op.credits) || op.credits <= 0.0)
            throw InvalidConversionError(i, where + "credits must be a positive number");

        const double available = credits_at(next, op.from);
        const double slack = kCreditSlack * std::max(1.0, available);
        if (op.credits > available + slack) {
            std::ostringstream os;
            os << where << "not enough credits in grade " << grade_symbol(op.from)
               << " (have " << available << ")";
            throw InvalidConversionError(i, os.str());
        }

        // A remainder within the slack is rounding noise: move all of it.
        double moved = op.credits;
        const double left = available - op.credits;
        if (left > slack) next[op.from] = left;
        else {
            next.erase(op.from);
            moved = available;
        }
        next[op.to] += moved;
    }
    return next;
}

Distribution simulate_future(const Distribution& dist, const std::vector<Addition>& ops) {
    const GradeScale& scale = GradeScale::standard();
    Distribution next = dist;

    for (std::size_t i = 0; i < ops.size(); ++i) {
        const Addition& op = ops[i];
        const std::string where = "Future course " + std::to_string(i + 1) + " (" + grade_symbol(op.grade) + "): ";

        if (!scale.is_gradeable(op.grade))
            throw InvalidAdditionError(i, where + "grade P has no point value");
        if (!std::isfinite(op.credits) || op.credits <= 0.0)
            throw InvalidAdditionError(i, where + "credits must be a positive number");

        next[op.grade] += op.credits;
    }
    return next;
}
