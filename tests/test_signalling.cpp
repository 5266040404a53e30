#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "signalling.h"


class Emitter : public ContextBase
{
    public:
        Emitter() :
            ContextBase(nullptr)
        {}

        DEFINE_SIGNAL(<>, changed, this);
        Signal<int, std::string> item_added{"item_added", this};
};

TEST(Signalling, emit_reaches_listeners)
{
    Emitter e;
    std::vector<std::string> items;
    int n = 0;

    SignalConnections connections;
    connections.connect(e.changed, [&]{n++;});
    connections.connect(e.item_added,
                        [&](int i, const std::string& s){items.emplace_back(std::to_string(i) + s);});

    e.changed.emit();
    e.changed.emit();
    e.item_added.emit(1, "a");

    EXPECT_EQ(n, 2);
    EXPECT_EQ(items, std::vector<std::string>({"1a"}));
    EXPECT_EQ(e.changed.get_name(), "changed");
}

TEST(Signalling, connections_disconnect_on_destruction)
{
    Emitter e;
    int n = 0;
    {
        SignalConnections connections;
        connections.connect(e.changed, [&]{n++;});
        EXPECT_TRUE(e.changed.has_listeners());
        e.changed.emit();
    }
    EXPECT_FALSE(e.changed.has_listeners());
    e.changed.emit();
    EXPECT_EQ(n, 1);
}

TEST(Signalling, signal_destroyed_first)
{
    SignalConnections connections;
    {
        Emitter e;
        connections.connect(e.changed, []{});
        connections.connect(e.item_added, [](int, const std::string&){});
        EXPECT_EQ(connections.size(), 2u);
    }
    EXPECT_EQ(connections.size(), 0u);
}

TEST(Signalling, explicit_disconnect)
{
    Emitter e;
    int n = 0;
    SignalConnections connections;
    connections.connect(e.changed, [&]{n++;});
    connections.disconnect(e.changed);
    e.changed.emit();
    EXPECT_EQ(n, 0);
    EXPECT_EQ(connections.size(), 0u);
}

TEST(Signalling, listener_may_disconnect_during_emit)
{
    Emitter e;
    int n = 0;
    auto connections = std::make_unique<SignalConnections>();
    connections->connect(e.changed, [&]{n++; connections->disconnect_all();});
    e.changed.emit();
    e.changed.emit();
    EXPECT_EQ(n, 1);
}

TEST(Signalling, listener_disconnected_during_emit_is_skipped)
{
    Emitter e;
    int first = 0;
    int second = 0;
    SignalConnections connections;
    auto later = std::make_unique<SignalConnections>();

    connections.connect(e.changed, [&]{first++; later.reset();});
    later->connect(e.changed, [&]{second++;});

    e.changed.emit();
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 0);
    EXPECT_FALSE(later);
}

TEST(Signalling, listener_connected_during_emit_waits_for_next_emit)
{
    Emitter e;
    int n = 0;
    SignalConnections connections;
    SignalConnections more;
    connections.connect(e.changed, [&]{
        if (!more.size())
            more.connect(e.changed, [&]{n++;});
    });

    e.changed.emit();
    EXPECT_EQ(n, 0);
    e.changed.emit();
    EXPECT_EQ(n, 1);
}
