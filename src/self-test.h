#ifndef _SELF_TEST_H
#define _SELF_TEST_H

/**
 * @brief run all self-tests
 *
 * @return 0 if all tests passed, 1 otherwise
 */
int run_self_tests();

#endif /* _SELF_TEST_H */
