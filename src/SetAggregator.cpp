#include "SetAggregator.h"
#include <vector>

using namespace std;

namespace {

ByteArraySet intersect(size_t count,
                       const SetAggregator::OperandSource& operandAt) {
    ByteArraySet result = operandAt(0);

    for (size_t i = 1; i < count && !result.empty(); i++) {
        result.retainAll(operandAt(i));
    }
    return result;
}

ByteArraySet unite(size_t count,
                   const SetAggregator::OperandSource& operandAt) {
    ByteArraySet result;
    for (size_t i = 0; i < count; i++) {
        result.addAll(operandAt(i));
    }
    return result;
}

ByteArraySet difference(size_t count,
                        const SetAggregator::OperandSource& operandAt) {
    ByteArraySet result = operandAt(0);

    for (size_t i = 1; i < count && !result.empty(); i++) {
        result.removeAll(operandAt(i));
    }
    return result;
}

}  // namespace

ByteArraySet SetAggregator::aggregate(SetOperation op, size_t count,
                                      const OperandSource& operandAt) {
    if (count == 0) {
        return {};
    }

    switch (op) {
        case SetOperation::Intersect:
            return intersect(count, operandAt);
        case SetOperation::Union:
            return unite(count, operandAt);
        case SetOperation::Difference:
            return difference(count, operandAt);
    }
    return {};
}

ByteArraySet SetAggregator::aggregate(SetOperation op,
                                      const vector<ByteArraySet>& operands) {
    return aggregate(op, operands.size(),
                     [&operands](size_t i) -> const ByteArraySet& {
                         return operands[i];
                     });
}
