#include "signalling.h"


SignalBase::SignalBase(const ContextBase* context) :
    ContextBase(*context)
{
}

SignalBase::~SignalBase()
{
    emit_finalize();
}

void SignalBase::connect_finalize(SignalBase::CallbackId callback_id,
                                  SignalBase::FinalizeCallback callback)
{
    m_finalize_listeners.emplace_back(callback_id, callback);
}

void SignalBase::disconnect_finalize(SignalBase::CallbackId callback_id)
{
    m_finalize_listeners.erase(std::remove_if(
                                   m_finalize_listeners.begin(), m_finalize_listeners.end(),
                                   [&](const FinalizeListenerEntry& e){return e.first == callback_id;}),
                               m_finalize_listeners.end());
}

void SignalBase::emit_finalize()
{
    auto listeners = m_finalize_listeners;
    for (auto& e : listeners)
        e.second(this);
}



SignalConnections::~SignalConnections()
{
    disconnect_all();
}

void SignalConnections::disconnect_all()
{
    // disconnect() modifies m_connections
    auto connections = m_connections;
    for (SignalBase* signal : connections)
        disconnect(*signal);
}

void SignalConnections::disconnect(SignalBase& signal)
{
    signal.disconnect_finalize(this);
    signal.disconnect(this);
    remove_connection(&signal);
}

void SignalConnections::remove_connection(const SignalBase* signal)
{
    m_connections.erase(std::remove_if(
                            m_connections.begin(), m_connections.end(),
                            [&](const SignalBase* s){return s == signal;}),
                        m_connections.end());
}
