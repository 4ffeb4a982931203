#include "goapagent/model/condition.hpp"

#include <algorithm>
#include <sstream>

namespace goapagent::model {

namespace {

class NotCondition : public Condition {
public:
    explicit NotCondition(ConditionPtr inner)
        : inner_(std::move(inner)), name_("!" + inner_->name()) {}

    const std::string& name() const override { return name_; }
    ZeroToOne cost() const override { return inner_->cost(); }

    ConditionDetermination evaluate(process::ProcessContext& context) const override {
        switch (inner_->evaluate(context)) {
            case ConditionDetermination::True: return ConditionDetermination::False;
            case ConditionDetermination::False: return ConditionDetermination::True;
            case ConditionDetermination::Unknown: return ConditionDetermination::Unknown;
        }
        return ConditionDetermination::Unknown;
    }

private:
    ConditionPtr inner_;
    std::string name_;
};

class UnknownCondition : public Condition {
public:
    explicit UnknownCondition(ConditionPtr inner)
        : inner_(std::move(inner)), name_("?" + inner_->name()) {}

    const std::string& name() const override { return name_; }
    ZeroToOne cost() const override { return inner_->cost(); }

    ConditionDetermination evaluate(process::ProcessContext& context) const override {
        return inner_->evaluate(context) == ConditionDetermination::Unknown
            ? ConditionDetermination::True
            : ConditionDetermination::False;
    }

private:
    ConditionPtr inner_;
    std::string name_;
};

// Shared by AND and OR: `dominant` short-circuits, UNKNOWN beats the other value
class BinaryCondition : public Condition {
public:
    BinaryCondition(ConditionPtr a, ConditionPtr b, const char* op, ConditionDetermination dominant)
        : a_(std::move(a))
        , b_(std::move(b))
        , name_("(" + a_->name() + " " + op + " " + b_->name() + ")")
        , dominant_(dominant)
    {
    }

    const std::string& name() const override { return name_; }

    ZeroToOne cost() const override { return std::min(a_->cost(), b_->cost()); }

    ConditionDetermination evaluate(process::ProcessContext& context) const override {
        const auto& first = a_->cost() <= b_->cost() ? a_ : b_;
        const auto& second = a_->cost() <= b_->cost() ? b_ : a_;

        auto first_result = first->evaluate(context);
        if (first_result == dominant_) {
            return dominant_;
        }
        auto second_result = second->evaluate(context);
        if (second_result == dominant_) {
            return dominant_;
        }
        if (first_result == ConditionDetermination::Unknown ||
            second_result == ConditionDetermination::Unknown) {
            return ConditionDetermination::Unknown;
        }
        return dominant_ == ConditionDetermination::True
            ? ConditionDetermination::False
            : ConditionDetermination::True;
    }

private:
    ConditionPtr a_;
    ConditionPtr b_;
    std::string name_;
    ConditionDetermination dominant_;
};

}  // namespace

std::string Condition::info_string() const {
    std::ostringstream ss;
    ss << "Condition(name='" << name() << "', cost=" << cost() << ")";
    return ss.str();
}

ConditionPtr not_condition(ConditionPtr condition) {
    return std::make_shared<NotCondition>(std::move(condition));
}

ConditionPtr unknown_condition(ConditionPtr condition) {
    return std::make_shared<UnknownCondition>(std::move(condition));
}

ConditionPtr and_conditions(ConditionPtr a, ConditionPtr b) {
    return std::make_shared<BinaryCondition>(std::move(a), std::move(b), "AND", ConditionDetermination::False);
}

ConditionPtr or_conditions(ConditionPtr a, ConditionPtr b) {
    return std::make_shared<BinaryCondition>(std::move(a), std::move(b), "OR", ConditionDetermination::True);
}

}  // namespace goapagent::model
