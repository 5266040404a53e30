#ifndef SIGNALLING_H
#define SIGNALLING_H

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "listcompleteglobals.h"

class SignalBase : public ContextBase
{
    public:
        using CallbackId = void*;
        using FinalizeCallback = std::function<void(const SignalBase*)>;
        using FinalizeListenerEntry = std::pair<CallbackId, FinalizeCallback>;

        SignalBase(const ContextBase* context);

        virtual ~SignalBase();

        virtual void disconnect(CallbackId callback_id) = 0;
        virtual bool has_listeners() = 0;

        void connect_finalize(CallbackId callback_id, FinalizeCallback callback);
        void disconnect_finalize(CallbackId callback_id);
        void emit_finalize();

        const std::string& get_name() const {return m_name;}

    protected:
        std::string m_name;
        std::vector<FinalizeListenerEntry> m_finalize_listeners;
};


// Synchronous signal, listeners run in the emitting thread.
template <typename ...TArgs>
class Signal : public SignalBase
{
    public:
        using Callback = std::function<void(TArgs...)>;

        struct ListenerEntry
        {
            CallbackId callback_id;
            Callback callback;
            bool connected{true};
        };
        using ListenerPtr = std::shared_ptr<ListenerEntry>;

        Signal(const char* name, const ContextBase* context) :
            SignalBase(context)
        {
            m_name = name;
        }

        void connect(CallbackId callback_id, Callback callback)
        {
            m_listeners.emplace_back(std::make_shared<ListenerEntry>(
                ListenerEntry{callback_id, callback}));
        }

        void disconnect(CallbackId callback_id) override
        {
            for (auto& e : m_listeners)
                if (e->callback_id == callback_id)
                    e->connected = false;
            m_listeners.erase(std::remove_if(
                m_listeners.begin(), m_listeners.end(),
                [](const ListenerPtr& e){return !e->connected;}),
                m_listeners.end());
        }

        virtual bool has_listeners() override
        {
            return !m_listeners.empty();
        }

        // Listeners connected during emission are called from the next
        // emission on, listeners disconnected during emission aren't
        // called anymore.
        void emit(const TArgs&... params)
        {
            auto listeners = m_listeners;
            for (auto& e : listeners)
                if (e->connected)
                    e->callback(params...);
        }

    private:
        std::vector<ListenerPtr> m_listeners;
};


// Auto-disconnect from signals on destruction
class SignalConnections
{
    public:
        ~SignalConnections();

        template<class S, typename F>
        void connect(S& signal, const F& func)
        {
            signal.connect(this, func);
            signal.connect_finalize(this,
                [this](const SignalBase* s){remove_connection(s);});
            m_connections.emplace_back(&signal);
        }

        void disconnect_all();
        void disconnect(SignalBase& signal);

        size_t size() const {return m_connections.size();}

    private:
        void remove_connection(const SignalBase* signal);

    private:
        std::vector<SignalBase*> m_connections;
};

#define DEFINE_SIGNAL(template_params, name, ...) \
              Signal template_params name{#name, __VA_ARGS__}

#endif // SIGNALLING_H
