/**
 * Pullcell - Load Cell Sampler
 * Implementation
 */

#include "sampler.h"
#include "pullcell.h"
#include "platform.h"
#include "config.h"
#include <Wire.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

// Static variables
static Adafruit_NAU7802* g_nau = nullptr;
static SampleChannel* g_channel = nullptr;
static TaskHandle_t g_sampler_task = nullptr;
static volatile uint32_t g_sample_count = 0;
static volatile uint32_t g_timeout_count = 0;

static void IRAM_ATTR onDataReady() {
    BaseType_t woken = pdFALSE;
    vTaskNotifyGiveFromISR(g_sampler_task, &woken);
    if (woken == pdTRUE) {
        portYIELD_FROM_ISR();
    }
}

static void samplerTask(void* param) {
    (void)param;

    for (;;) {
        if (ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(SAMPLER_DRDY_TIMEOUT_MS)) == 0) {
            g_timeout_count++;
        }

        // A missed edge leaves the conversion waiting; available() catches it on timeout
        if (!g_nau->available()) {
            continue;
        }

        RawSample sample;
        sample.count = g_nau->read();
        sample.timestamp_us = platformMicros();
        g_channel->pushOverwrite(sample);
        g_sample_count++;
    }
}

bool samplerInit(Adafruit_NAU7802& nau, SampleChannel& channel) {
    g_nau = &nau;
    g_channel = &channel;

    Wire.begin(PIN_I2C_SDA, PIN_I2C_SCL);
    if (!nau.begin(&Wire)) {
        Serial.println("NAU7802: FAILED");
        return false;
    }

    nau.setLDO(NAU7802_3V3);
    nau.setGain(NAU7802_GAIN_128);
    nau.setRate(NAU7802_RATE_80SPS);

    // Offset calibration must follow any gain/rate change
    if (!nau.calibrate(NAU7802_CALMOD_INTERNAL)) {
        Serial.println("NAU7802: WARNING - internal calibration failed");
    }

    // Flush conversions taken at the old settings
    for (int i = 0; i < 10; i++) {
        while (!nau.available()) {
            delay(1);
        }
        nau.read();
    }

    BaseType_t created = xTaskCreate(samplerTask, "sampler", SAMPLER_TASK_STACK_SIZE,
                                     nullptr, SAMPLER_TASK_PRIORITY, &g_sampler_task);
    if (created != pdPASS) {
        Serial.println("Sampler: ERROR - task creation failed");
        return false;
    }

    pinMode(PIN_NAU_DRDY, INPUT);
    attachInterrupt(digitalPinToInterrupt(PIN_NAU_DRDY), onDataReady, RISING);

    Serial.printf("NAU7802: OK (0x%02X, %d SPS, DRDY on GPIO %d)\n", I2C_ADDR_NAU7802, SAMPLE_RATE_HZ, PIN_NAU_DRDY);
    return true;
}

uint32_t samplerGetSampleCount() {
    return g_sample_count;
}

uint32_t samplerGetTimeoutCount() {
    return g_timeout_count;
}
