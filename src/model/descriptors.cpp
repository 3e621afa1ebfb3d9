#include <model/descriptors.hpp>

namespace arazzo::model {

CriterionType Criterion::effective_type() const {
    if(not type)
        return CriterionType::SIMPLE;
    if(auto const *plain = std::get_if<CriterionType>(&*type))
        return *plain;
    return std::get<CriterionExpressionType>(*type).type;
}

} // namespace arazzo::model
