#include "tanto/core/modify.hpp"
#include "tanto/core/schema_dump.hpp"
#include "tanto/core/typed.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// Domain model
struct fruit_amount {
    std::string fruit;
    int32_t amount;
};

struct basket {
    std::vector<fruit_amount> fruits;
};

namespace tanto {

template <> struct type_description<fruit_amount> {
    static type_descriptor describe() {
        return type_descriptor::product("FruitAmount")
            .with_field("fruit", ref_to<std::string>())
            .with_field("amount", ref_to<int32_t>());
    }
};

template <> struct type_description<basket> {
    static type_descriptor describe() {
        return type_descriptor::product("Basket").with_field("fruits",
                                                             ref_to<std::vector<fruit_amount>>());
    }
};

} // namespace tanto

using namespace tanto;

int main() {
    auto derived = derive_schema<basket>(configuration().with_snake_case_member_names());
    if (!derived) {
        std::cerr << "derivation failed: " << derived.error().message() << "\n";
        return 1;
    }
    std::cout << "derived:  " << dump_schema(*derived) << "\n";

    auto path = path_of<basket>(
        {path_segment::field("fruits"), path_segment::each(), path_segment::field("amount")});
    if (!path) {
        std::cerr << "bad path: " << path.error().message() << "\n";
        return 1;
    }

    auto documented = modify(*derived, *path, [](const schema& amount) {
        return amount.with_description("How many fruits?").with_validator(validator::min(1));
    });
    if (!documented) {
        std::cerr << "modification failed: " << documented.error().message() << "\n";
        return 1;
    }
    std::cout << "modified: " << dump_schema(*documented) << "\n";

    auto lens = at(*documented, *path);
    if (lens) {
        const auto rule = lens->get().combined_validator();
        for (int amount : {0, 3}) {
            auto errors = check(rule, value(amount));
            std::cout << "amount=" << amount << ": "
                      << (errors.empty() ? std::string("ok") : std::string(errors[0].message()))
                      << "\n";
        }
    }
    return 0;
}
