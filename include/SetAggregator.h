#ifndef SET_AGGREGATOR_H
#define SET_AGGREGATOR_H

#include <functional>
#include <vector>
#include "ByteArray.h"
#include "SetCommands.h"

class SetAggregator {
   public:
    // Supplies the set of the i-th input key, in caller order.
    using OperandSource = std::function<const ByteArraySet&(size_t)>;

    // Operand 0 is the base of a difference; the others are subtracted in
    // order. An intersection stops asking for operands once it is empty.
    static ByteArraySet aggregate(SetOperation op, size_t count,
                                  const OperandSource& operandAt);
    static ByteArraySet aggregate(SetOperation op,
                                  const std::vector<ByteArraySet>& operands);
};

#endif
