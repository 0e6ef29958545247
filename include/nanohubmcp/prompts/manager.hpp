#pragma once
#include "nanohubmcp/exceptions.hpp"
#include "nanohubmcp/prompts/prompt.hpp"
#include "nanohubmcp/util/registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace nanohubmcp::prompts
{

class PromptManager
{
  public:
    using PromptPtr = std::shared_ptr<const Prompt>;

    void add(Prompt p)
    {
        auto name = p.name;
        prompts_.put(name, std::move(p));
    }

    /// nullptr when absent.
    PromptPtr find(const std::string& name) const
    {
        return prompts_.find(name);
    }

    PromptPtr get(const std::string& name) const
    {
        auto p = prompts_.find(name);
        if (!p)
            throw NotFoundError("Prompt not found: " + name);
        return p;
    }

    bool has(const std::string& name) const
    {
        return prompts_.has(name);
    }

    std::vector<PromptPtr> list() const
    {
        return prompts_.list();
    }

    size_t size() const
    {
        return prompts_.size();
    }
    bool empty() const
    {
        return prompts_.empty();
    }

  private:
    util::OrderedRegistry<Prompt> prompts_;
};

} // namespace nanohubmcp::prompts
