#include "attrmap/reflect/Convert.hpp"

namespace attrmap { namespace reflect {

Diagnostics buildAttrValue(Context* context, const attr::Type& type, const wire::Value& value, const Path& path,
                           attr::ValuePtr& result) {
    Diagnostics diagnostics;
    auto error = value.validate();
    if (!error.empty()) {
        diagnostics.append(conversionErrorDiag(path, error));
        return diagnostics;
    }

    auto validator = dynamic_cast<const attr::TypeWithValidate*>(&type);
    if (validator) {
        diagnostics.append(validator->validate(context, value, path));
        if (diagnostics.hasError()) {
            return diagnostics;
        }
    }

    auto built = type.valueFromWire(context, value, error);
    if (!built) {
        diagnostics.append(valueFromWireErrorDiag(path, error));
        return diagnostics;
    }
    result = std::move(built);
    return diagnostics;
}

} // namespace reflect
} // namespace attrmap
