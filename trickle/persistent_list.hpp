#pragma once

#include <algorithm>
#include <memory>
#include <vector>

namespace trickle
{
    // Immutable singly linked list. push_front shares the existing nodes, so a
    // list can be extended by any number of independent owners.
    template <class T>
    struct persistent_list
    {
        persistent_list()
        {
        }

        persistent_list push_front(T element) const
        {
            return persistent_list(std::make_shared<node>(std::move(element), m_head));
        }

        bool empty() const
        {
            return !m_head;
        }

        std::size_t size() const
        {
            std::size_t result = 0;
            for (node const *i = m_head.get(); i; i = i->next.get())
            {
                ++result;
            }
            return result;
        }

        T const &front() const
        {
            return m_head->element;
        }

        // the elements in the order in which they were pushed
        std::vector<T> oldest_first() const
        {
            std::vector<T> result;
            for (node const *i = m_head.get(); i; i = i->next.get())
            {
                result.emplace_back(i->element);
            }
            std::reverse(result.begin(), result.end());
            return result;
        }

    private:
        struct node
        {
            T element;
            std::shared_ptr<node> next;

            node(T element, std::shared_ptr<node> next)
                : element(std::move(element))
                , next(std::move(next))
            {
            }

            ~node()
            {
                // unlink the tail one node at a time so that long lists do not
                // recurse through the destructors
                std::shared_ptr<node> rest = std::move(next);
                while (rest && (rest.use_count() == 1))
                {
                    std::shared_ptr<node> following = std::move(rest->next);
                    rest = std::move(following);
                }
            }
        };

        std::shared_ptr<node> m_head;

        explicit persistent_list(std::shared_ptr<node> head)
            : m_head(std::move(head))
        {
        }
    };
}
