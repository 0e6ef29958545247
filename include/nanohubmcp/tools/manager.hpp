#pragma once
#include "nanohubmcp/exceptions.hpp"
#include "nanohubmcp/tools/tool.hpp"
#include "nanohubmcp/util/registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace nanohubmcp::tools
{

class ToolManager
{
  public:
    using ToolPtr = std::shared_ptr<const Tool>;

    void register_tool(Tool t)
    {
        auto name = t.name();
        tools_.put(name, std::move(t));
    }

    /// nullptr when no tool has that name.
    ToolPtr find(const std::string& name) const
    {
        return tools_.find(name);
    }

    ToolPtr get(const std::string& name) const
    {
        auto tool = tools_.find(name);
        if (!tool)
            throw NotFoundError("Tool not found: " + name);
        return tool;
    }

    bool has(const std::string& name) const
    {
        return tools_.has(name);
    }

    ToolOutput invoke(const std::string& name, const Json& input,
                      server::Context* ctx = nullptr) const
    {
        return get(name)->invoke(input, ctx);
    }

    std::vector<ToolPtr> list() const
    {
        return tools_.list();
    }

    std::vector<std::string> list_names() const
    {
        std::vector<std::string> names;
        for (const auto& t : tools_.list())
            names.push_back(t->name());
        return names;
    }

    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }

  private:
    util::OrderedRegistry<Tool> tools_;
};

} // namespace nanohubmcp::tools
