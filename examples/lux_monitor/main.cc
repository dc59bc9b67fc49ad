#include <inttypes.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#include <driver/gpio.h>
#include <driver/i2c_master.h>
#include <esp_log.h>
#include <i2c_master_port.hh>
#include <tsl2591.hh>
#define TAG "MAIN"

constexpr i2c_port_num_t I2C_PORT{0};
constexpr gpio_num_t PIN_SCL{GPIO_NUM_22};
constexpr gpio_num_t PIN_SDA{GPIO_NUM_21};
//INT is open drain, active low
constexpr gpio_num_t PIN_INT{GPIO_NUM_4};
//BOOT button, active low
constexpr gpio_num_t PIN_BUTTON{GPIO_NUM_0};
constexpr uint16_t THRESHOLD_LOW{0};
constexpr uint16_t THRESHOLD_HIGH{20000};
constexpr TickType_t SENSOR_LOCK_TIMEOUT{pdMS_TO_TICKS(1000)};

static TaskHandle_t readoutTask{nullptr};
static TaskHandle_t powerToggleTask{nullptr};

//both tasks share the driver, every sequence of driver calls happens with sensorLock held
static SemaphoreHandle_t sensorLock{nullptr};
static TSL2591::M *sensor{nullptr};

static void IRAM_ATTR onGpioFallingEdge(void *arg)
{
    BaseType_t woken{pdFALSE};
    vTaskNotifyGiveFromISR(*static_cast<TaskHandle_t *>(arg), &woken);
    portYIELD_FROM_ISR(woken);
}

static ErrorCode configureSensor(TSL2591::M &sensor)
{
    uint8_t id{0};
    ErrorCode e = sensor.Setup(id);
    if (e != ErrorCode::OK)
    {
        ESP_LOGE(TAG, "Sensor setup failed: %s (id 0x%02X)", ErrorCodeStr[(int)e], id);
        return e;
    }
    ERRORCODE_CHECK(sensor.SetGain(TSL2591::GAIN::MED));
    ERRORCODE_CHECK(sensor.SetIntegration(TSL2591::INTEGRATION::_600MS));
    ERRORCODE_CHECK(sensor.EnableInterrupt(true));
    ERRORCODE_CHECK(sensor.SetPersist(TSL2591::PERSIST::_1));
    ERRORCODE_CHECK(sensor.SetThreshold(THRESHOLD_LOW, THRESHOLD_HIGH));
    ESP_LOGI(TAG, "Interrupt whenever the visible count leaves [%" PRIu16 ", %" PRIu16 "]", THRESHOLD_LOW, THRESHOLD_HIGH);
    return ErrorCode::OK;
}

static void readoutLoop(void *)
{
    while (true)
    {
        ulTaskNotifyTake(pdTRUE, portMAX_DELAY);
        if (!xSemaphoreTake(sensorLock, SENSOR_LOCK_TIMEOUT))
        {
            ESP_LOGE(TAG, "Could not take sensor mutex for readout");
            continue;
        }
        //the sensor keeps INT asserted until cleared
        TSL2591::Lux lux{};
        ErrorCode e = sensor->ClearInterrupt();
        if (e == ErrorCode::OK)
        {
            e = sensor->GetLux(lux, true);
        }
        xSemaphoreGive(sensorLock);

        switch (e)
        {
        case ErrorCode::OK:
            ESP_LOGI(TAG, "Lux: %" PRId32 ".%06" PRId32, lux.integer, lux.fractional);
            break;
        case ErrorCode::ADC_SATURATED:
            ESP_LOGW(TAG, "Sensor saturated, consider a lower gain");
            break;
        default:
            ESP_LOGE(TAG, "Readout failed: %s", ErrorCodeStr[(int)e]);
            break;
        }
    }
}

static void powerToggleLoop(void *)
{
    while (true)
    {
        ulTaskNotifyTake(pdTRUE, portMAX_DELAY);
        if (!xSemaphoreTake(sensorLock, SENSOR_LOCK_TIMEOUT))
        {
            ESP_LOGE(TAG, "Could not take sensor mutex for power toggle");
            continue;
        }
        const bool wasOn = sensor->IsPoweredOn();
        ErrorCode e = wasOn ? sensor->PowerOff() : sensor->PowerOn();
        xSemaphoreGive(sensorLock);

        if (e != ErrorCode::OK)
        {
            ESP_LOGE(TAG, "Could not power %s sensor: %s", wasOn ? "off" : "on", ErrorCodeStr[(int)e]);
            continue;
        }
        ESP_LOGI(TAG, "Sensor powered %s", wasOn ? "off" : "on");
    }
}

extern "C" void app_main(void)
{
    i2c_master_bus_config_t bus_cfg = {
        .i2c_port = I2C_PORT,
        .sda_io_num = PIN_SDA,
        .scl_io_num = PIN_SCL,
        .clk_source = I2C_CLK_SRC_DEFAULT,
        .glitch_ignore_cnt = 7,
        .intr_priority = 0,
        .trans_queue_depth = 0,
        .flags = {
            .enable_internal_pullup = true,
        },
    };
    i2c_master_bus_handle_t bus_handle;
    ESP_ERROR_CHECK(i2c_new_master_bus(&bus_cfg, &bus_handle));

    //TSL2591 supports fast mode up to 400kHz
    static I2CMasterPort port(bus_handle, 400000);
    if (port.IsAvailable(TSL2591::I2C_ADDRESS) != ErrorCode::OK)
    {
        ESP_LOGE(TAG, "No TSL2591 at 0x%02X", TSL2591::I2C_ADDRESS);
        return;
    }
    static TSL2591::M tsl2591(&port);
    if (configureSensor(tsl2591) != ErrorCode::OK)
    {
        return;
    }
    sensor = &tsl2591;
    sensorLock = xSemaphoreCreateMutex();
    if (sensorLock == nullptr)
    {
        ESP_LOGE(TAG, "Could not create sensor mutex");
        return;
    }

    if (xTaskCreate(readoutLoop, "readout", 4096, nullptr, 5, &readoutTask) != pdPASS ||
        xTaskCreate(powerToggleLoop, "powerToggle", 3072, nullptr, 4, &powerToggleTask) != pdPASS)
    {
        ESP_LOGE(TAG, "Could not create sensor tasks");
        return;
    }

    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_NEGEDGE;
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pull_up_en = GPIO_PULLUP_ENABLE;
    io_conf.pin_bit_mask = (1ULL << PIN_INT) | (1ULL << PIN_BUTTON);
    ESP_ERROR_CHECK(gpio_config(&io_conf));
    ESP_ERROR_CHECK(gpio_install_isr_service(0));
    ESP_ERROR_CHECK(gpio_isr_handler_add(PIN_INT, onGpioFallingEdge, &readoutTask));
    ESP_ERROR_CHECK(gpio_isr_handler_add(PIN_BUTTON, onGpioFallingEdge, &powerToggleTask));
    ESP_LOGI(TAG, "Press BOOT to toggle sensor power");
}
