#include <gtest/gtest.h>

#include "chat_options.hpp"
#include "chat_transcript.hpp"

#include <string>
#include <vector>

using sc::chat::ChatTranscript;
using sc::chat::MessageId;

TEST(ChatTranscript, AssignsIncreasingIds)
{
    ChatTranscript transcript;
    MessageId first = transcript.append("alice", "hi", 1000);
    MessageId second = transcript.append("bob", "hello", 1001);
    MessageId third = transcript.append("alice", "how are you", 1002, true);

    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
    ASSERT_EQ(transcript.size(), 3u);
    EXPECT_EQ(transcript.at(1).user, "bob");
    EXPECT_TRUE(transcript.at(2).local);
    EXPECT_EQ(transcript.indexOf(third).value_or(99), 2u);
}

TEST(ChatTranscript, TrimsOldestLinesAtCapacity)
{
    ChatTranscript transcript(3);
    std::vector<MessageId> ids;
    for (int i = 0; i < 5; ++i)
        ids.push_back(transcript.append("u", "line " + std::to_string(i), i));

    ASSERT_EQ(transcript.size(), 3u);
    EXPECT_EQ(transcript.at(0).text, "line 2");
    EXPECT_FALSE(transcript.indexOf(ids[0]).has_value());
    EXPECT_EQ(transcript.indexOf(ids[4]).value_or(99), 2u);

    transcript.setCapacity(1);
    ASSERT_EQ(transcript.size(), 1u);
    EXPECT_EQ(transcript.at(0).id, ids[4]);

    // Ids are not reused after trimming.
    EXPECT_GT(transcript.append("u", "next", 9), ids[4]);
}

TEST(ChatTranscript, HistoryIsMergedByTimestamp)
{
    ChatTranscript transcript;
    transcript.append("a", "ten", 10);
    transcript.append("a", "thirty", 30);
    std::uint64_t revision = transcript.revision();

    transcript.insertHistory("b", "twenty", 20);
    transcript.insertHistory("b", "five", 5);
    transcript.insertHistory("b", "forty", 40);

    std::vector<std::string> texts;
    for (const auto &line : transcript.lines())
        texts.push_back(line.text);
    std::vector<std::string> expected{"five", "ten", "twenty", "thirty", "forty"};
    EXPECT_EQ(texts, expected);
    EXPECT_GT(transcript.revision(), revision);
}

TEST(ChatTranscript, HistoryOlderThanAFullScrollbackIsDropped)
{
    ChatTranscript transcript(2);
    transcript.append("a", "ten", 10);
    transcript.append("a", "twenty", 20);
    std::uint64_t revision = transcript.revision();

    EXPECT_FALSE(transcript.insertHistory("b", "five", 5).has_value());
    EXPECT_EQ(transcript.size(), 2u);
    EXPECT_EQ(transcript.revision(), revision);
    EXPECT_EQ(transcript.at(0).text, "ten");

    std::optional<sc::chat::MessageId> id = transcript.insertHistory("b", "fifteen", 15);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(transcript.indexOf(*id).has_value());
    EXPECT_EQ(*transcript.indexOf(*id), 0u);
    EXPECT_EQ(transcript.at(1).text, "twenty");
}

TEST(ChatTranscript, FindIsCaseInsensitiveAndWraps)
{
    ChatTranscript transcript;
    transcript.append("alice", "Good morning", 1);
    transcript.append("bob", "coffee?", 2);
    transcript.append("carol", "MORNING all", 3);

    EXPECT_EQ(transcript.find("morning").value_or(99), 0u);
    EXPECT_EQ(transcript.find("morning", 1).value_or(99), 2u);
    EXPECT_EQ(transcript.find("good", 1).value_or(99), 0u);
    EXPECT_EQ(transcript.find("BOB:").value_or(99), 1u);
    EXPECT_FALSE(transcript.find("tea").has_value());
}

TEST(ChatOptions, RegistersDefaultsAndClampsValues)
{
    sc::config::OptionRegistry registry("sc-chat-test");
    sc::chat::registerChatOptions(registry);

    EXPECT_FALSE(registry.getBool(sc::chat::kOptionNaturalScrolling, true));
    EXPECT_EQ(sc::chat::scrollbackLimit(registry), 500u);
    EXPECT_FLOAT_EQ(sc::chat::animationRate(registry), 30.0f);

    registry.set(sc::chat::kOptionScrollbackLimit, sc::config::OptionValue(std::int64_t{-4}));
    registry.set(sc::chat::kOptionAnimationRate, sc::config::OptionValue(std::int64_t{12}));
    EXPECT_EQ(sc::chat::scrollbackLimit(registry), 500u);
    EXPECT_FLOAT_EQ(sc::chat::animationRate(registry), 12.0f);

    EXPECT_EQ(sc::chat::userName(registry), "you");
    registry.set(sc::chat::kOptionUserName, sc::config::OptionValue("  "));
    EXPECT_EQ(sc::chat::userName(registry), "you");
    registry.set(sc::chat::kOptionUserName, sc::config::OptionValue("ferris"));
    EXPECT_EQ(sc::chat::userName(registry), "ferris");
}
