#ifndef _TEST_PATTERN_INDEX_H
#define _TEST_PATTERN_INDEX_H

void test_pattern_index();

#endif /* _TEST_PATTERN_INDEX_H */
