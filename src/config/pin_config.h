// src/config/pin_config.h
// Role: Central compile-time pin configuration.
//
// Defaults match a Heltec-style ESP32 + SX1276 board. Override per board via build flags:
//   build_flags =
//     -D ESN_PIN_LORA_NSS=18
//     -D ESN_PIN_LORA_DIO1=33
//     -D ESN_PIN_I2C_SDA=21
//     -D ESN_PIN_I2C_SCL=22
//
// A pin set to -1 is "not connected"; drivers must treat it as such.

#pragma once

// LoRa transceiver (SPI + DIO lines used by the LoRaWAN stack)
#ifndef ESN_PIN_LORA_NSS
#define ESN_PIN_LORA_NSS 18
#endif
#ifndef ESN_PIN_LORA_RST
#define ESN_PIN_LORA_RST 14
#endif
#ifndef ESN_PIN_LORA_DIO0
#define ESN_PIN_LORA_DIO0 26
#endif
#ifndef ESN_PIN_LORA_DIO1
#define ESN_PIN_LORA_DIO1 33
#endif
#ifndef ESN_PIN_LORA_DIO2
#define ESN_PIN_LORA_DIO2 32
#endif

// I2C (SCD4x air sensor, seesaw soil probe)
#ifndef ESN_PIN_I2C_SDA
#define ESN_PIN_I2C_SDA 21
#endif
#ifndef ESN_PIN_I2C_SCL
#define ESN_PIN_I2C_SCL 22
#endif

// Battery voltage through a 1:3 divider into an ADC1 pin.
#ifndef ESN_PIN_BATTERY_ADC
#define ESN_PIN_BATTERY_ADC 35
#endif
#ifndef ESN_BATTERY_DIVIDER
#define ESN_BATTERY_DIVIDER 3.0f
#endif

// Held low at boot: factory-reset config and drop the stored session.
#ifndef ESN_PIN_PROVISION_BUTTON
#define ESN_PIN_PROVISION_BUTTON 0
#endif

// Seesaw soil probe I2C address (0x36..0x39 via address jumpers).
#ifndef ESN_SOIL_I2C_ADDR
#define ESN_SOIL_I2C_ADDR 0x36
#endif
