/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Dependencies/RequirementResolver.h"

#include "Core/Logger.h"

#include <algorithm>

namespace mshc {
namespace Homog {
namespace dependencies {

void RequirementResolver::addProducer(const std::string& name,
                                      std::vector<std::string> requirements,
                                      Producer producer)
{
    HOMOG_THROW_IF(name.empty(), InvalidArgumentException,
                   "RequirementResolver::addProducer: empty name");
    HOMOG_THROW_IF(entries_.count(name) > 0, InvalidArgumentException,
                   "RequirementResolver::addProducer: '" + name + "' already registered");
    HOMOG_THROW_IF(!producer, InvalidArgumentException,
                   "RequirementResolver::addProducer: empty producer for '" + name + "'");

    Entry entry;
    entry.requirements = std::move(requirements);
    entry.producer = std::move(producer);
    entries_.emplace(name, std::move(entry));
}

void RequirementResolver::addValue(const std::string& name, DependencyValue value)
{
    HOMOG_THROW_IF(name.empty(), InvalidArgumentException,
                   "RequirementResolver::addValue: empty name");
    HOMOG_THROW_IF(entries_.count(name) > 0, InvalidArgumentException,
                   "RequirementResolver::addValue: '" + name + "' already registered");

    const bool is_null = std::visit([](const auto& ptr) { return ptr == nullptr; }, value);
    HOMOG_THROW_IF(is_null, InvalidArgumentException,
                   "RequirementResolver::addValue: null value for '" + name + "'");

    entries_.emplace(name, Entry{});
    cache_.emplace(name, std::move(value));
}

bool RequirementResolver::has(const std::string& name) const noexcept
{
    return entries_.count(name) > 0;
}

bool RequirementResolver::isCached(const std::string& name) const noexcept
{
    return cache_.count(name) > 0;
}

const std::vector<std::string>& RequirementResolver::requirementsOf(const std::string& name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        HOMOG_THROW_WITH(MissingDependencyException, name,
                         "RequirementResolver: no producer registered");
    }
    return it->second.requirements;
}

DependencyMap RequirementResolver::resolve(const std::vector<std::string>& names)
{
    DependencyMap out;
    std::vector<std::string> stack;
    for (const auto& name : names) {
        if (out.has(name)) {
            continue;
        }
        out.insert(name, compute(name, stack));
    }
    return out;
}

const DependencyValue& RequirementResolver::compute(const std::string& name,
                                                    std::vector<std::string>& stack)
{
    auto cached = cache_.find(name);
    if (cached != cache_.end()) {
        HOMOG_LOG_DEBUG("RequirementResolver: '" + name + "' taken from cache");
        return cached->second;
    }

    auto it = entries_.find(name);
    if (it == entries_.end()) {
        std::string msg = "RequirementResolver: no producer registered";
        if (!stack.empty()) {
            msg += " (required by '" + stack.back() + "')";
        }
        HOMOG_THROW_WITH(MissingDependencyException, name, msg);
    }

    if (std::find(stack.begin(), stack.end(), name) != stack.end()) {
        std::string chain;
        for (const auto& s : stack) {
            chain += s + " -> ";
        }
        chain += name;
        throw HomogException("RequirementResolver: dependency cycle " + chain,
                             __FILE__, __LINE__, __FUNCTION__, HomogStatus::DependencyCycle);
    }

    // Copy: producers may register further entries while running.
    const Entry entry = it->second;

    stack.push_back(name);
    DependencyMap inputs;
    for (const auto& req : entry.requirements) {
        if (!inputs.has(req)) {
            inputs.insert(req, compute(req, stack));
        }
    }

    DependencyValue value;
    try {
        HOMOG_TIMED_SCOPE_LEVEL("producer of '" + name + "'", LogLevel::DEBUG);
        value = entry.producer(inputs);
    } catch (HomogException& e) {
        e.add_context("while computing '" + name + "'");
        throw;
    }
    stack.pop_back();

    const bool is_null = std::visit([](const auto& ptr) { return ptr == nullptr; }, value);
    HOMOG_THROW_IF(is_null, InvalidArgumentException,
                   "RequirementResolver: producer of '" + name + "' returned null");

    HOMOG_LOG_DEBUG(std::string("RequirementResolver: computed '") + name + "' (" +
                    dependency_kind_to_string(kindOf(value)) + ")");

    return cache_.emplace(name, std::move(value)).first->second;
}

void RequirementResolver::clearCache()
{
    for (auto it = cache_.begin(); it != cache_.end();) {
        auto entry = entries_.find(it->first);
        const bool registered_value = entry != entries_.end() && !entry->second.producer;
        if (registered_value) {
            ++it;
        } else {
            it = cache_.erase(it);
        }
    }
}

} // namespace dependencies
} // namespace Homog
} // namespace mshc
