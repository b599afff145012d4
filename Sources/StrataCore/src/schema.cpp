#include "strata/schema.hpp"
#include <stdexcept>

namespace strata {

attribute_meta::attribute_meta(std::string name, std::string field_name,
                               value_kind storage_kind, bool nullable)
    : name_(std::move(name))
    , field_name_(std::move(field_name))
    , storage_kind_(storage_kind)
    , nullable_(nullable) {
    if (name_.empty()) {
        throw std::invalid_argument("The attribute name is empty.");
    }
}

model_meta_base::model_meta_base(std::string model_class_name, bool top_level)
    : model_class_name_(std::move(model_class_name))
    , top_level_(top_level) {
    if (model_class_name_.empty()) {
        throw std::invalid_argument("The modelClass parameter is empty.");
    }
    auto pos = model_class_name_.rfind("::");
    if (pos == std::string::npos) {
        simple_name_ = model_class_name_;
    } else {
        package_name_ = model_class_name_.substr(0, pos);
        simple_name_ = model_class_name_.substr(pos + 2);
    }
    kind_ = simple_name_;
}

model_meta_base::model_meta_base(std::string package_name, std::string simple_name, bool top_level)
    : package_name_(std::move(package_name))
    , simple_name_(std::move(simple_name))
    , top_level_(top_level) {
    if (simple_name_.empty()) {
        throw std::invalid_argument("The modelClass parameter is empty.");
    }
    model_class_name_ = package_name_.empty() ? simple_name_ : package_name_ + "::" + simple_name_;
    kind_ = simple_name_;
}

const attribute_meta* model_meta_base::find_attribute(const std::string& name) const {
    for (const auto& attr : attributes_) {
        if (attr.name() == name) return &attr;
    }
    return nullptr;
}

const attribute_meta& model_meta_base::attribute_desc(const std::string& name) const {
    const attribute_meta* attr = find_attribute(name);
    if (attr == nullptr) {
        throw std::out_of_range("No attribute '" + name + "' in " + model_class_name_);
    }
    return *attr;
}

void model_meta_base::set_kind(std::string kind) {
    if (sealed_) {
        throw std::logic_error("Model meta " + model_class_name_ + " is sealed.");
    }
    if (kind.empty()) {
        throw std::invalid_argument("The kind parameter is empty.");
    }
    kind_ = std::move(kind);
}

size_t model_meta_base::add_attribute_desc(attribute_meta desc) {
    if (sealed_) {
        throw std::logic_error("Model meta " + model_class_name_ + " is sealed.");
    }
    if (find_attribute(desc.name()) != nullptr) {
        throw std::invalid_argument("Duplicate attribute '" + desc.name() + "' in " + model_class_name_);
    }
    attributes_.push_back(std::move(desc));
    return attributes_.size() - 1;
}

} // namespace strata
