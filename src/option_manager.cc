#include "option_manager.hh"

#include "assert.hh"
#include "debug.hh"
#include "option_types.hh"

namespace TextSeek
{

OptionDesc::OptionDesc(String name, String docstring)
    : m_name(std::move(name)), m_docstring(std::move(docstring)) {}

Option::Option(const OptionDesc& desc, OptionManager& manager)
    : m_manager(manager), m_desc(desc) {}

OptionManager::OptionManager(OptionManager& parent)
    : m_parent(&parent)
{
    parent.register_watcher(*this);
}

OptionManager::~OptionManager()
{
    if (m_parent)
        m_parent->unregister_watcher(*this);

    ts_assert(m_watchers.empty());
}

void OptionManager::register_watcher(OptionManagerWatcher& watcher) const
{
    ts_assert(std::find(m_watchers.begin(), m_watchers.end(), &watcher) == m_watchers.end());
    m_watchers.push_back(&watcher);
}

void OptionManager::unregister_watcher(OptionManagerWatcher& watcher) const
{
    auto it = std::find(m_watchers.begin(), m_watchers.end(), &watcher);
    ts_assert(it != m_watchers.end());
    m_watchers.erase(it);
}

struct option_not_found : public runtime_error
{
    option_not_found(StringView name)
        : runtime_error(format("option not found: '{}'", name)) {}
};

OptionManager::OptionMap::iterator OptionManager::find_local(StringView name)
{
    return std::find_if(m_options.begin(), m_options.end(),
                        [name](const std::unique_ptr<Option>& option)
                        { return option->name() == name; });
}

Option& OptionManager::get_local_option(StringView name)
{
    auto it = find_local(name);
    if (it != m_options.end())
        return **it;
    else if (m_parent)
    {
        m_options.emplace_back((*m_parent)[name].clone(*this));
        return *m_options.back();
    }
    else
        throw option_not_found(name);

}

Option& OptionManager::operator[](StringView name)
{
    auto it = find_local(name);
    if (it != m_options.end())
        return **it;
    else if (m_parent)
        return (*m_parent)[name];
    else
        throw option_not_found(name);
}

const Option& OptionManager::operator[](StringView name) const
{
    return const_cast<OptionManager&>(*this)[name];
}

void OptionManager::unset_option(StringView name)
{
    if (not m_parent)
        throw runtime_error(format("cannot unset option '{}' at the global scope", name));

    auto it = find_local(name);
    if (it != m_options.end())
    {
        auto& parent_option = (*m_parent)[name];
        const bool changed = not parent_option.has_same_value(**it);
        m_options.erase(it);
        if (changed)
            on_option_changed(parent_option);
    }
}

void OptionManager::on_option_changed(const Option& option)
{
    // if parent option changed, but we overrided it, it's like nothing happened
    if (&option.manager() != this and find_local(option.name()) != m_options.end())
        return;

    if (&option.manager() == this and (*this)["debug"].get<DebugFlags>() & DebugFlags::Options)
        write_to_debug_log(format("option '{}' changed to '{}'", option.name(), option.get_as_string()));

    // The watcher list might get mutated during calls to on_option_changed
    auto watchers = m_watchers;
    for (auto* watcher : watchers)
    {
        // make sure this watcher is still alive
        if (std::find(m_watchers.begin(), m_watchers.end(), watcher) != m_watchers.end())
            watcher->on_option_changed(option);
    }
}

}
