#ifndef _TEST_TEXT_CIPHER_H
#define _TEST_TEXT_CIPHER_H

void test_text_cipher();

#endif /* _TEST_TEXT_CIPHER_H */
