#pragma once

#include <optional>
#include <vector>
#include <stdexcept>


namespace Msg {
    /**
     * @brief Bounded ring used between a producer loop and a slower consumer.
     *
     * When full, push() overwrites the oldest element so the consumer always sees the
     * most recent items. Not synchronized; callers guard it with their own mutex.
     */
    template <typename T>
    class CircularBuffer {
    public:
        explicit CircularBuffer(size_t capacity) :
            m_Slots(capacity),
            m_Head(0),
            m_Size(0) {
            if (capacity == 0) {
                throw std::invalid_argument("Capacity cannot be zero.");
            }
        }

        /**
         * @brief Append an item
         *
         * @return true if the oldest item was overwritten to make room
         */
        bool push(const T& item) {
            const bool overwrote = isFull();
            m_Slots[m_Head] = item;
            m_Head = (m_Head + 1) % m_Slots.size();
            if (!overwrote) {
                m_Size++;
            }
            return overwrote;
        }

        // Oldest item out
        T pop() {
            if (isEmpty()) {
                throw std::out_of_range("Buffer is empty.");
            }
            const size_t idx = oldest();
            T item = std::move(m_Slots[idx]);
            m_Slots[idx] = T();
            m_Size--;
            return item;
        }

        // Newest item, left in place
        T& getHead() {
            if (isEmpty()) {
                throw std::out_of_range("Buffer is empty.");
            }
            return m_Slots[(m_Head + m_Slots.size() - 1) % m_Slots.size()];
        }

        /**
         * @brief Remove the newest item and discard everything older
         *
         * @param skipped Set to the number of older items discarded
         * @return std::optional<T> The newest item, nullopt when empty
         */
        std::optional<T> takeNewest(size_t& skipped) {
            skipped = 0;
            if (isEmpty()) {
                return std::nullopt;
            }
            std::optional<T> item(std::move(getHead()));
            skipped = m_Size - 1;
            flush();
            return item;
        }

        // 0 is the oldest item, size()-1 the newest
        T& operator[](size_t index) {
            if (index >= m_Size) {
                throw std::out_of_range("Index out of bounds.");
            }
            return m_Slots[(oldest() + index) % m_Slots.size()];
        }

        const T& operator[](size_t index) const {
            if (index >= m_Size) {
                throw std::out_of_range("Index out of bounds.");
            }
            return m_Slots[(oldest() + index) % m_Slots.size()];
        }

        // Release every held item
        void flush() {
            for (auto& slot : m_Slots) {
                slot = T();
            }
            m_Head = 0;
            m_Size = 0;
        }

        bool isEmpty() const {
            return m_Size == 0;
        }

        bool isFull() const {
            return m_Size == m_Slots.size();
        }

        size_t size() const {
            return m_Size;
        }

        size_t capacity() const {
            return m_Slots.size();
        }

    private:
        size_t oldest() const {
            return (m_Head + m_Slots.size() - m_Size) % m_Slots.size();
        }

        std::vector<T> m_Slots;
        size_t m_Head;  // Next slot to write
        size_t m_Size;
    };
}
