#pragma once

#include <QtTest/QtTest>

class ConfigTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void test_dotted_path_lookup();
    void test_layers_merge();
    void test_value_copy_survives_layer_replacement();
    void test_required_keys_validation();
    void test_name_rewrites();
    void test_display_strings_from_i18n();
    void test_app_settings();
    void test_app_settings_require_token();
    void test_app_settings_channel_env_fallback();
};
