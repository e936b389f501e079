#pragma once

#include <boost/test/unit_test.hpp>
#include <boost/noncopyable.hpp>
#include <silicium/config.hpp>

namespace trickle
{
    namespace test
    {
        // Fails the test unless it is entered exactly as often as expected, and
        // only after it has been enabled.
        struct checkpoint : private boost::noncopyable
        {
            explicit checkpoint(std::size_t const expected_entries = 1)
                : m_state(state::created)
                , m_expected_entries(expected_entries)
                , m_entries(0)
            {
            }

            ~checkpoint() BOOST_NOEXCEPT_IF(false)
            {
                if (state::crossed != m_state)
                {
                    boost::throw_exception(std::logic_error("A checkpoint has not been crossed"));
                }
            }

            void enable()
            {
                if (state::created != m_state)
                {
                    boost::throw_exception(std::logic_error("A checkpoint can be enabled only once"));
                }
                m_state = (m_expected_entries == 0) ? state::crossed : state::enabled;
            }

            void enter()
            {
                if (state::enabled != m_state)
                {
                    boost::throw_exception(std::logic_error("Entered a checkpoint that was not expected"));
                }
                ++m_entries;
                if (m_entries == m_expected_entries)
                {
                    m_state = state::crossed;
                }
            }

            void require_crossed() const
            {
                BOOST_REQUIRE_EQUAL(state::crossed, m_state);
            }

            void require_pending() const
            {
                BOOST_REQUIRE_EQUAL(state::enabled, m_state);
            }

        private:
            enum class state
            {
                created,
                enabled,
                crossed
            };

            friend std::ostream &operator<<(std::ostream &out, state s)
            {
                switch (s)
                {
                case state::created:
                    return out << "created";
                case state::enabled:
                    return out << "enabled";
                case state::crossed:
                    return out << "crossed";
                }
                SILICIUM_UNREACHABLE();
            }

            state m_state;
            std::size_t m_expected_entries;
            std::size_t m_entries;
        };
    }
}
