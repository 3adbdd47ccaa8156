// Every test in this directory runs at compile time via static_assert:
// building constexpr_tests is the test.
int main() {
    return 0;
}
