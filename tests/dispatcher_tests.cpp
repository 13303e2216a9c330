#include <gtest/gtest.h>
#include "dispatcher.hpp"
#include <cstdint>

namespace
{
    class DispatcherTest : public ::testing::Test
    {
    protected:
        std::int64_t now = 1'700'000'000'000;
        hk::Keyspace keyspace{[this] { return now; }};
        hk::ServerInfo info;
        hk::Dispatcher dispatcher{keyspace, info};
        hk::Session session;

        std::string run(const std::string &line)
        {
            return hk::render_text(dispatcher.dispatch(session, line));
        }

        std::string run(const std::vector<std::string> &args)
        {
            return hk::render_text(dispatcher.dispatch(session, args));
        }
    };
}

TEST_F(DispatcherTest, FullWorkflow)
{
    EXPECT_EQ(run("SET name John"), "+OK");
    EXPECT_EQ(run("SET age 25"), "+OK");

    EXPECT_EQ(run("GET name"), "John");
    EXPECT_EQ(run("GET age"), "25");

    EXPECT_EQ(run("DEL name"), ":1");
    EXPECT_EQ(run("GET name"), "(nil)");
    EXPECT_EQ(run("GET age"), "25");

    EXPECT_EQ(run("PING"), "+PONG");
}

TEST_F(DispatcherTest, PingAndEcho)
{
    EXPECT_EQ(run("PING hello"), "hello");
    EXPECT_EQ(run("ECHO hi"), "hi");
    EXPECT_EQ(run(std::vector<std::string>{"ECHO", "two words"}), "two words");
}

TEST_F(DispatcherTest, CommandNamesAreCaseInsensitiveKeysAreNot)
{
    EXPECT_EQ(run("set Key 1"), "+OK");
    EXPECT_EQ(run("GeT Key"), "1");
    EXPECT_EQ(run("GET key"), "(nil)");
}

TEST_F(DispatcherTest, UnknownCommand)
{
    EXPECT_EQ(run("UNKNOWN"), "ERR unknown command 'unknown'");
    EXPECT_EQ(run("INVALID arg1"), "ERR unknown command 'invalid'");
    EXPECT_EQ(run(""), "ERR empty command");
}

TEST_F(DispatcherTest, WrongArgumentCount)
{
    EXPECT_EQ(run("GET"), "ERR wrong number of arguments for 'get'");
    EXPECT_EQ(run("GET a b"), "ERR wrong number of arguments for 'get'");
    EXPECT_EQ(run("DEL"), "ERR wrong number of arguments for 'del'");
    EXPECT_EQ(run("HSET h f"), "ERR wrong number of arguments for 'hset'");
    EXPECT_EQ(run("HSET h a b c"), "ERR wrong number of arguments for 'hset'");
    EXPECT_EQ(run("ZADD z 1 a 2"), "ERR wrong number of arguments for 'zadd'");
    EXPECT_EQ(run("AUTH"), "ERR wrong number of arguments for 'auth'");
}

TEST_F(DispatcherTest, DelIsIdempotentAndCountsRemovedKeys)
{
    run("SET a 1");
    run("SET b 2");
    EXPECT_EQ(run("DEL a b c"), ":2");
    EXPECT_EQ(run("DEL a b c"), ":0");
    EXPECT_EQ(run("EXISTS a b"), ":0");
}

TEST_F(DispatcherTest, ContainersRejectWrongType)
{
    const std::string wrongtype = "ERR WRONGTYPE Operation against a key holding the wrong kind of value";
    EXPECT_EQ(run("LPUSH l a"), ":1");
    EXPECT_EQ(run("GET l"), wrongtype);
    EXPECT_EQ(run("INCR l"), wrongtype);
    EXPECT_EQ(run("SADD l x"), wrongtype);
    EXPECT_EQ(run("HGET l f"), wrongtype);
    EXPECT_EQ(run("ZSCORE l m"), wrongtype);

    run("SET s text");
    EXPECT_EQ(run("LPUSH s a"), wrongtype);
    EXPECT_EQ(run("LRANGE l 0 -1"), "a");
    EXPECT_EQ(run("GET s"), "text");
}

TEST_F(DispatcherTest, TypeReportsEachVariant)
{
    run("SET s v");
    run("RPUSH l v");
    run("HSET h f v");
    run("SADD st v");
    run("ZADD z 1 v");
    EXPECT_EQ(run("TYPE s"), "+string");
    EXPECT_EQ(run("TYPE l"), "+list");
    EXPECT_EQ(run("TYPE h"), "+hash");
    EXPECT_EQ(run("TYPE st"), "+set");
    EXPECT_EQ(run("TYPE z"), "+zset");
    EXPECT_EQ(run("TYPE none"), "+none");
}

TEST_F(DispatcherTest, Counters)
{
    EXPECT_EQ(run("INCR c"), ":1");
    EXPECT_EQ(run("INCRBY c 10"), ":11");
    EXPECT_EQ(run("DECR c"), ":10");
    EXPECT_EQ(run("DECRBY c 20"), ":-10");
    EXPECT_EQ(run("GET c"), "-10");

    run("SET s abc");
    EXPECT_EQ(run("INCR s"), "ERR value is not an integer or out of range");
    EXPECT_EQ(run("INCRBY c notanumber"), "ERR value is not an integer or out of range");
    EXPECT_EQ(run("GET c"), "-10");

    run("SET max 9223372036854775807");
    EXPECT_EQ(run("INCR max"), "ERR value is not an integer or out of range");
}

TEST_F(DispatcherTest, CounterRoundTrip)
{
    run("SET c 10");
    run("INCR c");
    run("INCR c");
    run("DECR c");
    EXPECT_EQ(run("GET c"), "11");
}

TEST_F(DispatcherTest, ExpireZeroRemovesWithoutSweep)
{
    run("SET k v");
    EXPECT_EQ(run("EXPIRE k 0"), ":1");
    EXPECT_EQ(run("GET k"), "(nil)");
    EXPECT_EQ(run("EXISTS k"), ":0");
}

TEST_F(DispatcherTest, SetWithExpiryOptions)
{
    EXPECT_EQ(run("SET k v EX 10"), "+OK");
    EXPECT_EQ(run("TTL k"), ":10");
    EXPECT_EQ(run("PTTL k"), ":10000");

    EXPECT_EQ(run("SET p v px 1500"), "+OK");
    EXPECT_EQ(run("PTTL p"), ":1500");

    EXPECT_EQ(run("SET k v EX 0"), "ERR invalid expire time in 'set'");
    EXPECT_EQ(run("SET k v XX 1"), "ERR syntax error");
    EXPECT_EQ(run("SET k v EX"), "ERR syntax error");

    now += 10'000;
    EXPECT_EQ(run("GET k"), "(nil)");
    EXPECT_EQ(run("TTL k"), ":-2");
}

TEST_F(DispatcherTest, ExpireTtlPersist)
{
    EXPECT_EQ(run("EXPIRE k 5"), ":0");
    run("SET k v");
    EXPECT_EQ(run("TTL k"), ":-1");
    EXPECT_EQ(run("EXPIRE k 5"), ":1");
    EXPECT_EQ(run("TTL k"), ":5");

    EXPECT_EQ(run("PERSIST k"), ":1");
    EXPECT_EQ(run("PERSIST k"), ":0");
    EXPECT_EQ(run("TTL k"), ":-1");

    EXPECT_EQ(run("EXPIRE k 5"), ":1");
    now += 4'999;
    EXPECT_EQ(run("GET k"), "v");
    now += 1;
    EXPECT_EQ(run("GET k"), "(nil)");
    EXPECT_EQ(run("EXISTS k"), ":0");
}

TEST_F(DispatcherTest, ExpireInThePastDeletesImmediately)
{
    run("SET k v");
    EXPECT_EQ(run("EXPIRE k -1"), ":1");
    EXPECT_EQ(run("EXISTS k"), ":0");

    run("SET k v");
    EXPECT_EQ(run("EXPIREAT k 1"), ":1");
    EXPECT_EQ(run("GET k"), "(nil)");

    run("SET k v");
    const std::string at = std::to_string(now + 2'000);
    EXPECT_EQ(run("PEXPIREAT k " + at), ":1");
    EXPECT_EQ(run("PTTL k"), ":2000");
}

TEST_F(DispatcherTest, Lists)
{
    EXPECT_EQ(run("RPUSH l a b c"), ":3");
    EXPECT_EQ(run("LPUSH l z"), ":4");
    EXPECT_EQ(run("LRANGE l 0 -1"), "z\na\nb\nc");
    EXPECT_EQ(run("LRANGE l -2 -1"), "b\nc");
    EXPECT_EQ(run("LRANGE l 10 20"), "(empty)");
    EXPECT_EQ(run("LLEN l"), ":4");

    EXPECT_EQ(run("LPOP l"), "z");
    EXPECT_EQ(run("RPOP l"), "c");
    EXPECT_EQ(run("LPOP l"), "a");
    EXPECT_EQ(run("LPOP l"), "b");
    EXPECT_EQ(run("LPOP l"), "(nil)");
    EXPECT_EQ(run("EXISTS l"), ":0");
    EXPECT_EQ(run("LLEN l"), ":0");
    EXPECT_EQ(run("LRANGE missing 0 -1"), "(empty)");
}

TEST_F(DispatcherTest, Hashes)
{
    EXPECT_EQ(run("HSET h f2 v2 f1 v1"), ":2");
    EXPECT_EQ(run("HSET h f1 x"), ":0");
    EXPECT_EQ(run("HGET h f1"), "x");
    EXPECT_EQ(run("HGET h nope"), "(nil)");
    EXPECT_EQ(run("HGETALL h"), "f1\nx\nf2\nv2");
    EXPECT_EQ(run("HKEYS h"), "f1\nf2");
    EXPECT_EQ(run("HVALS h"), "x\nv2");
    EXPECT_EQ(run("HEXISTS h f1"), ":1");
    EXPECT_EQ(run("HLEN h"), ":2");

    EXPECT_EQ(run("HDEL h f1 nope"), ":1");
    EXPECT_EQ(run("HEXISTS h f1"), ":0");
    EXPECT_EQ(run("HDEL h f2"), ":1");
    EXPECT_EQ(run("EXISTS h"), ":0");
    EXPECT_EQ(run("HGETALL h"), "(empty)");
}

TEST_F(DispatcherTest, Sets)
{
    EXPECT_EQ(run("SADD s b a b"), ":2");
    EXPECT_EQ(run("SADD s a"), ":0");
    EXPECT_EQ(run("SMEMBERS s"), "a\nb");
    EXPECT_EQ(run("SISMEMBER s a"), ":1");
    EXPECT_EQ(run("SISMEMBER s z"), ":0");
    EXPECT_EQ(run("SREM s a z"), ":1");
    EXPECT_EQ(run("SCARD s"), ":1");
    EXPECT_EQ(run("SREM s b"), ":1");
    EXPECT_EQ(run("TYPE s"), "+none");
}

TEST_F(DispatcherTest, SortedSets)
{
    EXPECT_EQ(run("ZADD z 2 b 1 a 1 c"), ":3");
    EXPECT_EQ(run("ZADD z 3 b"), ":0");
    EXPECT_EQ(run("ZRANGE z 0 -1"), "a\nc\nb");
    EXPECT_EQ(run("ZRANGE z 0 -1 withscores"), "a\n1\nc\n1\nb\n3");
    EXPECT_EQ(run("ZSCORE z b"), "3");
    EXPECT_EQ(run("ZSCORE z nope"), "(nil)");
    EXPECT_EQ(run("ZRANK z b"), ":2");
    EXPECT_EQ(run("ZRANK z nope"), "(nil)");
    EXPECT_EQ(run("ZCARD z"), ":3");

    EXPECT_EQ(run("ZADD z abc x"), "ERR value is not a valid float");
    EXPECT_EQ(run("ZRANGE z 0 -1 FOO"), "ERR syntax error");
    EXPECT_EQ(run("ZADD z -inf low"), ":1");
    EXPECT_EQ(run("ZRANGE z 0 0 WITHSCORES"), "low\n-inf");

    EXPECT_EQ(run("ZREM z a low nope"), ":2");
    EXPECT_EQ(run("ZCARD z"), ":2");
}

TEST_F(DispatcherTest, KeysDbsizeFlush)
{
    run("SET user:1 a");
    run("SET user:2 b");
    run("SADD other x");
    EXPECT_EQ(run("KEYS *"), "other\nuser:1\nuser:2");
    EXPECT_EQ(run("KEYS user:*"), "user:1\nuser:2");
    EXPECT_EQ(run("KEYS nothing*"), "(empty)");
    EXPECT_EQ(run("DBSIZE"), ":3");

    EXPECT_EQ(run("FLUSHDB"), "+OK");
    EXPECT_EQ(run("DBSIZE"), ":0");
}

TEST_F(DispatcherTest, InfoReportsKeyspace)
{
    run("SET a 1");
    run("SET b 2 EX 100");
    hk::Reply reply = dispatcher.dispatch(session, std::string("INFO"));
    ASSERT_EQ(reply.kind, hk::Reply::Kind::Bulk);
    EXPECT_NE(reply.text.find("# Keyspace"), std::string::npos);
    EXPECT_NE(reply.text.find("keys:2\r\n"), std::string::npos);
    EXPECT_NE(reply.text.find("expires:1\r\n"), std::string::npos);
    EXPECT_NE(reply.text.find("aof_enabled:0"), std::string::npos);
}

TEST(DispatcherAuth, CommandsGatedUntilAuthenticated)
{
    hk::Keyspace keyspace;
    hk::ServerInfo info;
    hk::Dispatcher dispatcher(keyspace, info);
    hk::Session session(std::string("secret"));

    auto run = [&](const std::string &line) { return hk::render_text(dispatcher.dispatch(session, line)); };

    EXPECT_EQ(run("GET a"), "ERR NOAUTH Authentication required");
    EXPECT_EQ(run("PING"), "ERR NOAUTH Authentication required");
    EXPECT_EQ(run("AUTH wrong"), "ERR invalid password (1/3)");
    EXPECT_EQ(run("AUTH secret"), "+OK");
    EXPECT_EQ(run("SET a 1"), "+OK");
    EXPECT_EQ(run("GET a"), "1");
}

TEST(DispatcherAuth, LockoutIsCounted)
{
    hk::Keyspace keyspace;
    hk::ServerInfo info;
    hk::Dispatcher dispatcher(keyspace, info);
    hk::Session session(std::string("secret"));

    for (int i = 0; i < 3; ++i)
    {
        dispatcher.dispatch(session, std::string("AUTH nope"));
    }
    EXPECT_TRUE(session.locked());
    EXPECT_EQ(info.auth_lockouts.load(), 1u);
}

TEST(DispatcherAuth, NoPasswordConfigured)
{
    hk::Keyspace keyspace;
    hk::ServerInfo info;
    hk::Dispatcher dispatcher(keyspace, info);
    hk::Session session;

    EXPECT_EQ(hk::render_text(dispatcher.dispatch(session, std::string("AUTH x"))),
              "ERR AUTH called without any password configured");
    EXPECT_EQ(hk::render_text(dispatcher.dispatch(session, std::string("PING"))), "+PONG");
}
