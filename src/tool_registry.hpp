#pragma once
#include <string>
#include <map>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include "cancellation.hpp"
#include "errors.hpp"

namespace strata {

// The token is cancelled when the calling turn abandons the call.
using ToolFunction = std::function<std::string(const nlohmann::json&, const CancellationToken&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    ToolFunction func;
};

// Function table behind one builtin tool server.
class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        std::string name = def.name;
        if (!tools_.count(name)) order_.push_back(name);
        tools_[name] = std::move(def);
    }

    bool has(const std::string& name) const {
        return tools_.count(name) > 0;
    }

    std::string execute(const std::string& name, const nlohmann::json& args,
                        const CancellationToken& token = CancellationToken()) const {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw ToolNotFound(name);
        }
        return it->second.func(args, token);
    }

    // Definitions in registration order.
    std::vector<const ToolDef*> defs() const {
        std::vector<const ToolDef*> out;
        for (auto& n : order_) out.push_back(&tools_.at(n));
        return out;
    }

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, ToolDef> tools_;
    std::vector<std::string> order_;
};

} // namespace strata
