#ifndef sqlforge_DECIMAL_H
#define sqlforge_DECIMAL_H

#include <string>

namespace sqlforge {

    // 定点数，以文本保存，避免 double 带来的精度损失
    class Decimal {
      public:
        Decimal() = default;
        explicit Decimal(std::string text) : m_text(std::move(text)) {
        }

        const std::string &toString() const {
            return m_text;
        }

        bool isEmpty() const {
            return m_text.empty();
        }

        // "0", "0.00", "-0" 都视为零
        bool isZero() const {
            bool seen_digit = false;
            for (char c : m_text) {
                if (c >= '1' && c <= '9') return false;
                if (c == '0') seen_digit = true;
            }
            return seen_digit;
        }

        bool operator==(const Decimal &other) const = default;

      private:
        std::string m_text;
    };

}  // namespace sqlforge

#endif  // sqlforge_DECIMAL_H
