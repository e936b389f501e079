#include "results.hpp"
#include <trickle/input_state.hpp>
#include <trickle/persistent_list.hpp>
#include <boost/test/unit_test.hpp>
#include <sstream>

BOOST_AUTO_TEST_CASE(token_buffer_default_is_empty)
{
    trickle::token_buffer<char> const empty;
    BOOST_CHECK(empty.empty());
    BOOST_CHECK_EQUAL(0u, empty.size());
    BOOST_CHECK_EQUAL(0u, empty.position());
    BOOST_CHECK(empty.begin() == empty.end());
}

BOOST_AUTO_TEST_CASE(token_buffer_take_and_drop)
{
    trickle::token_buffer<char> const buffer(trickle::test::chars("hello"));
    BOOST_CHECK_EQUAL("he", trickle::test::text(buffer.take(2)));
    BOOST_CHECK_EQUAL("llo", trickle::test::text(buffer.drop(2)));
    BOOST_CHECK_EQUAL(2u, buffer.drop(2).position());
    BOOST_CHECK_EQUAL(5u, buffer.drop(2).end_position());
    BOOST_CHECK_EQUAL("hello", trickle::test::text(buffer.take(100)));
    BOOST_CHECK(buffer.drop(100).empty());
    BOOST_CHECK_EQUAL('l', buffer.drop(2).front());
    BOOST_CHECK_EQUAL('o', buffer.drop(2)[2]);
}

BOOST_AUTO_TEST_CASE(token_buffer_span)
{
    trickle::token_buffer<char> const buffer(trickle::test::chars("aab"));
    auto const split = buffer.span([](char c)
                                   {
                                       return c == 'a';
                                   });
    BOOST_CHECK_EQUAL("aa", trickle::test::text(split.first));
    BOOST_CHECK_EQUAL("b", trickle::test::text(split.second));
    BOOST_CHECK_EQUAL(2u, split.second.position());
}

BOOST_AUTO_TEST_CASE(token_buffer_append_does_not_change_existing_views)
{
    trickle::token_buffer<char> const original(trickle::test::chars("ab"));
    trickle::token_buffer<char> const in_place = original.append(trickle::test::chars("c"));
    BOOST_CHECK_EQUAL("ab", trickle::test::text(original));
    BOOST_CHECK_EQUAL("abc", trickle::test::text(in_place));

    // `original` no longer ends where the arena ends, so this has to copy
    trickle::token_buffer<char> const copied = original.append(trickle::test::chars("x"));
    BOOST_CHECK_EQUAL("abx", trickle::test::text(copied));
    BOOST_CHECK_EQUAL("abc", trickle::test::text(in_place));
    BOOST_CHECK_EQUAL("ab", trickle::test::text(original));
    BOOST_CHECK_EQUAL(0u, copied.position());
}

BOOST_AUTO_TEST_CASE(token_buffer_copy_keeps_absolute_positions)
{
    trickle::token_buffer<char> const original(trickle::test::chars("abcd"));
    trickle::token_buffer<char> const view = original.drop(1).take(2);
    trickle::token_buffer<char> const copied = view.append(trickle::test::chars("x"));
    BOOST_CHECK_EQUAL("bcx", trickle::test::text(copied));
    BOOST_CHECK_EQUAL(1u, copied.position());
    BOOST_CHECK_EQUAL(4u, copied.end_position());
}

BOOST_AUTO_TEST_CASE(token_buffer_append_to_empty)
{
    trickle::token_buffer<char> const appended = trickle::token_buffer<char>().append(trickle::test::chars("xy"));
    BOOST_CHECK_EQUAL("xy", trickle::test::text(appended));
    trickle::token_buffer<char> const unchanged = appended.append(std::vector<char>());
    BOOST_CHECK(appended == unchanged);
}

BOOST_AUTO_TEST_CASE(token_buffer_stream_since)
{
    trickle::token_buffer<char> const buffer(trickle::test::chars("abcd"));
    trickle::token_buffer<char> const consumed = buffer.drop(3);
    BOOST_CHECK_EQUAL("bcd", trickle::test::text(consumed.stream_since(1)));
    BOOST_CHECK_EQUAL("abcd", trickle::test::text(consumed.stream_since(0)));
    BOOST_CHECK(consumed.stream_since(4).empty());
}

BOOST_AUTO_TEST_CASE(token_buffer_extended_with)
{
    trickle::token_buffer<char> const buffer(trickle::test::chars("ab"));
    trickle::token_buffer<char> const grown = buffer.drop(2).append(trickle::test::chars("cd"));
    trickle::token_buffer<char> const extended = buffer.extended_with(grown);
    BOOST_CHECK_EQUAL("abcd", trickle::test::text(extended));
    BOOST_CHECK_EQUAL(0u, extended.position());
    BOOST_CHECK(buffer.extended_with(trickle::token_buffer<char>()) == buffer);
}

BOOST_AUTO_TEST_CASE(token_buffer_releases_dropped_input)
{
    trickle::token_buffer<char> remaining;
    for (std::size_t i = 0; i < 100000; ++i)
    {
        remaining = remaining.append(trickle::test::chars("ab"));
        remaining = remaining.drop(remaining.size());
    }
    BOOST_CHECK(remaining.empty());
    BOOST_CHECK_EQUAL(200000u, remaining.position());
    BOOST_CHECK_LE(remaining.stream_since(0).size(), 2u);
}

BOOST_AUTO_TEST_CASE(token_buffer_releases_dropped_input_while_it_grows)
{
    trickle::token_buffer<char> remaining;
    for (std::size_t i = 0; i < 1000; ++i)
    {
        remaining = remaining.append(trickle::test::chars("ab"));
        remaining = remaining.drop(1);
        BOOST_REQUIRE_LE(remaining.stream_since(0).size(), 2 * remaining.size() + 2);
    }
    BOOST_CHECK_EQUAL(1000u, remaining.size());
    BOOST_CHECK_EQUAL(1000u, remaining.position());
    BOOST_CHECK_EQUAL('a', remaining.front());
    BOOST_CHECK_EQUAL('b', remaining[remaining.size() - 1]);
}

BOOST_AUTO_TEST_CASE(token_buffer_keeps_input_a_snapshot_can_reach)
{
    trickle::token_buffer<char> const snapshot(trickle::test::chars("abcd"));
    trickle::token_buffer<char> const consumed = snapshot.drop(4).append(trickle::test::chars("e"));
    BOOST_CHECK_EQUAL("abcde", trickle::test::text(consumed.stream_since(0)));
    BOOST_CHECK_EQUAL("abcde", trickle::test::text(snapshot.extended_with(consumed.stream_since(4))));
}

BOOST_AUTO_TEST_CASE(more_input_combine)
{
    using trickle::more_input;
    BOOST_CHECK_EQUAL(more_input::incomplete, trickle::combine(more_input::incomplete, more_input::incomplete));
    BOOST_CHECK_EQUAL(more_input::complete, trickle::combine(more_input::complete, more_input::incomplete));
    BOOST_CHECK_EQUAL(more_input::complete, trickle::combine(more_input::incomplete, more_input::complete));
    BOOST_CHECK_EQUAL(more_input::complete, trickle::combine(more_input::complete, more_input::complete));
}

BOOST_AUTO_TEST_CASE(more_input_print)
{
    std::ostringstream out;
    out << trickle::more_input::complete << ' ' << trickle::more_input::incomplete;
    BOOST_CHECK_EQUAL("complete incomplete", out.str());
}

BOOST_AUTO_TEST_CASE(add_stream_keeps_input_pulled_after_the_snapshot)
{
    trickle::input_state<char> const before =
        trickle::make_input_state(trickle::test::chars("ab"), trickle::more_input::incomplete);
    trickle::input_state<char> const after{before.remaining.drop(2).append(trickle::test::chars("cd")),
                                           trickle::more_input::complete};
    trickle::input_state<char> const merged = trickle::add_stream(before, after);
    BOOST_CHECK_EQUAL("abcd", trickle::test::text(merged.remaining));
    BOOST_CHECK_EQUAL(trickle::more_input::complete, merged.more);
}

BOOST_AUTO_TEST_CASE(add_stream_without_new_input)
{
    trickle::input_state<char> const before =
        trickle::make_input_state(trickle::test::chars("ab"), trickle::more_input::incomplete);
    trickle::input_state<char> const after{before.remaining.drop(1), trickle::more_input::incomplete};
    trickle::input_state<char> const merged = trickle::add_stream(before, after);
    BOOST_CHECK_EQUAL("ab", trickle::test::text(merged.remaining));
    BOOST_CHECK_EQUAL(trickle::more_input::incomplete, merged.more);
}

BOOST_AUTO_TEST_CASE(add_stream_across_a_copied_arena)
{
    trickle::input_state<char> const start =
        trickle::make_input_state(trickle::test::chars("abc"), trickle::more_input::incomplete);
    trickle::input_state<char> const before{start.remaining.take(2), trickle::more_input::incomplete};
    // appending to a view that does not end at the arena end copies it
    trickle::input_state<char> const after{before.remaining.drop(1).append(trickle::test::chars("xy")),
                                           trickle::more_input::incomplete};
    BOOST_CHECK_EQUAL("bxy", trickle::test::text(after.remaining));
    trickle::input_state<char> const merged = trickle::add_stream(before, after);
    BOOST_CHECK_EQUAL("abxy", trickle::test::text(merged.remaining));
}

BOOST_AUTO_TEST_CASE(persistent_list_order)
{
    trickle::persistent_list<int> const empty;
    trickle::persistent_list<int> const one = empty.push_front(1);
    trickle::persistent_list<int> const two = one.push_front(2);
    trickle::persistent_list<int> const other = one.push_front(3);
    BOOST_CHECK(empty.empty());
    BOOST_CHECK_EQUAL(2u, two.size());
    BOOST_CHECK_EQUAL(2, two.front());
    BOOST_CHECK_EQUAL(3, other.front());
    std::vector<int> const expected = {1, 2};
    std::vector<int> const found = two.oldest_first();
    BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), found.begin(), found.end());
}

BOOST_AUTO_TEST_CASE(persistent_list_long_destruction)
{
    trickle::persistent_list<int> list;
    for (int i = 0; i < 2000000; ++i)
    {
        list = list.push_front(i);
    }
    BOOST_CHECK_EQUAL(1999999, list.front());
}
